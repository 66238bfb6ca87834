#include "chunk/text_chunkers.hpp"
#include <sstream>

namespace workspace_rag {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Returns 1..3 for "# ", "## ", "### " headers, 0 otherwise.
int header_level(const std::string& line, std::string& title) {
    std::string stripped = trim(line);
    size_t hashes = 0;
    while (hashes < stripped.size() && stripped[hashes] == '#') ++hashes;
    if (hashes == 0 || hashes > 3) return 0;
    if (hashes < stripped.size() && stripped[hashes] != ' ' && stripped[hashes] != '\t') return 0;
    title = trim(stripped.substr(hashes));
    return static_cast<int>(hashes);
}

bool is_fence(const std::string& line) {
    std::string stripped = trim(line);
    return stripped.rfind("```", 0) == 0 || stripped.rfind("~~~", 0) == 0;
}

} // namespace

std::vector<MarkdownChunker::Section> MarkdownChunker::split_sections(const std::string& text) const {
    std::vector<Section> sections;
    Section current;
    std::string body;
    bool in_code_block = false;

    auto flush = [&]() {
        std::string content = trim(body);
        if (!content.empty()) {
            current.content = content;
            sections.push_back(current);
        }
        body.clear();
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (is_fence(line)) in_code_block = !in_code_block;

        std::string title;
        int level = in_code_block ? 0 : header_level(line, title);
        if (level == 0) {
            body += line;
            body += '\n';
            continue;
        }

        flush();
        if (level == 1) {
            current.header_1 = title;
            current.header_2.clear();
            current.header_3.clear();
        } else if (level == 2) {
            current.header_2 = title;
            current.header_3.clear();
        } else {
            current.header_3 = title;
        }
    }
    flush();
    return sections;
}

std::vector<Chunk> MarkdownChunker::chunk(const Artifact& artifact) const {
    if (artifact.content().empty()) return {};

    auto sections = split_sections(artifact.content());
    std::vector<std::string> texts;
    texts.reserve(sections.size());
    for (const auto& s : sections) {
        texts.push_back("Header#1 " + s.header_1 + "\n" +
                        "Header#2: " + s.header_2 + "\n" +
                        "Header#3: " + s.header_3 + "\n" +
                        "Content: \n\n  " + s.content);
    }

    auto chunks = create_chunks(texts, artifact);
    // Size reflects the section body, not the rendered header block.
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].chunk_metadata.chunk_size = static_cast<int>(sections[i].content.size());
        chunks[i].chunk_metadata.chunk_overlap = 0;
    }
    return chunks;
}

} // namespace workspace_rag
