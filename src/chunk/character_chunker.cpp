#include "chunk/text_chunkers.hpp"
#include <deque>
#include <spdlog/spdlog.h>

namespace workspace_rag {

namespace {

std::string strip(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_on(const std::string& text, const std::string& separator) {
    std::vector<std::string> pieces;
    if (separator.empty()) {
        for (char c : text) pieces.emplace_back(1, c);
        return pieces;
    }
    size_t start = 0;
    while (true) {
        size_t pos = text.find(separator, start);
        std::string piece = text.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!piece.empty()) pieces.push_back(std::move(piece));
        if (pos == std::string::npos) break;
        start = pos + separator.size();
    }
    return pieces;
}

std::string join_pieces(const std::deque<std::string>& pieces, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) out += separator;
        out += pieces[i];
    }
    return strip(out);
}

} // namespace

std::vector<std::string> CharacterChunker::split_text(const std::string& text) const {
    const std::string& separator = config_.chunk_separator;
    const size_t chunk_size = static_cast<size_t>(config_.chunk_size);
    const size_t chunk_overlap = static_cast<size_t>(config_.chunk_overlap);
    const size_t sep_len = separator.size();

    std::vector<std::string> docs;
    std::deque<std::string> current;
    size_t total = 0;

    for (auto& piece : split_on(text, separator)) {
        const size_t len = piece.size();
        if (total + len + (current.empty() ? 0 : sep_len) > chunk_size) {
            if (total > chunk_size) {
                spdlog::warn("⚠️ Created a chunk of size {}, which is longer than the specified {}", total, chunk_size);
            }
            if (!current.empty()) {
                auto doc = join_pieces(current, separator);
                if (!doc.empty()) docs.push_back(std::move(doc));

                // Drop leading pieces until only the overlap remains and the
                // next piece fits.
                while (total > chunk_overlap ||
                       (total + len + (current.empty() ? 0 : sep_len) > chunk_size && total > 0)) {
                    total -= current.front().size() + (current.size() > 1 ? sep_len : 0);
                    current.pop_front();
                }
            }
        }
        current.push_back(std::move(piece));
        total += len + (current.size() > 1 ? sep_len : 0);
    }

    auto doc = join_pieces(current, separator);
    if (!doc.empty()) docs.push_back(std::move(doc));
    return docs;
}

std::vector<Chunk> CharacterChunker::chunk(const Artifact& artifact) const {
    if (artifact.content().empty()) return {};
    return create_chunks(split_text(artifact.content()), artifact);
}

} // namespace workspace_rag
