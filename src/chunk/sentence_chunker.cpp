#include "chunk/text_chunkers.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace workspace_rag {

namespace {

bool is_sentence_end(char c) {
    return c == '.' || c == '!' || c == '?';
}

// Sentence boundary: terminal punctuation followed by whitespace, or a blank line.
std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        current += text[i];
        bool boundary = false;
        if (is_sentence_end(text[i]) && (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])))) {
            boundary = true;
        } else if (text[i] == '\n' && i + 1 < text.size() && text[i + 1] == '\n') {
            boundary = true;
        }
        if (boundary) {
            sentences.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) sentences.push_back(std::move(current));
    return sentences;
}

std::vector<std::string> tokenize_whitespace(const std::string& sentence) {
    std::vector<std::string> tokens;
    std::istringstream in(sentence);
    std::string token;
    while (in >> token) tokens.push_back(token);
    return tokens;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += ' ';
        out += tokens[i];
    }
    return out;
}

std::vector<std::string> tail(const std::vector<std::string>& tokens, size_t n) {
    if (n >= tokens.size()) return tokens;
    return std::vector<std::string>(tokens.end() - static_cast<std::ptrdiff_t>(n), tokens.end());
}

} // namespace

SentenceTokenChunker::SentenceTokenChunker(ChunkConfig config) : ChunkerBase(std::move(config)) {
    if (config_.chunk_overlap >= config_.tokens_per_chunk) {
        throw std::invalid_argument("sentence_token chunker needs chunk_overlap < tokens_per_chunk");
    }
}

std::vector<std::string> SentenceTokenChunker::split_text(const std::string& text) const {
    const size_t limit = static_cast<size_t>(config_.tokens_per_chunk);
    const size_t overlap = static_cast<size_t>(config_.chunk_overlap);

    std::vector<std::string> chunks;
    std::vector<std::string> current;
    size_t fresh = 0;  // tokens added since the last emitted chunk

    auto emit = [&]() {
        chunks.push_back(join_tokens(current));
        current = tail(current, overlap);
        fresh = 0;
    };

    for (const auto& sentence : split_sentences(text)) {
        auto tokens = tokenize_whitespace(sentence);
        if (tokens.empty()) continue;

        if (tokens.size() <= limit) {
            if (fresh > 0 && current.size() + tokens.size() > limit) {
                emit();
            }
            if (current.size() + tokens.size() > limit) {
                current = tail(current, limit - tokens.size());
            }
            current.insert(current.end(), tokens.begin(), tokens.end());
            fresh += tokens.size();
            continue;
        }

        // Sentence longer than a whole chunk: fall back to token windows.
        for (auto& token : tokens) {
            if (current.size() == limit) emit();
            current.push_back(std::move(token));
            ++fresh;
        }
    }

    if (fresh > 0) chunks.push_back(join_tokens(current));
    return chunks;
}

std::vector<Chunk> SentenceTokenChunker::chunk(const Artifact& artifact) const {
    if (artifact.content().empty()) return {};
    return create_chunks(split_text(artifact.content()), artifact);
}

} // namespace workspace_rag
