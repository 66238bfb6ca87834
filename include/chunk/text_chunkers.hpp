#pragma once

#include <string>
#include <vector>
#include <utility>
#include "chunk/chunker.hpp"

namespace workspace_rag {

// Splits on chunk_separator, then greedily merges pieces up to chunk_size
// characters, carrying up to chunk_overlap characters of trailing pieces into
// the next chunk. A single piece longer than chunk_size becomes its own chunk.
class CharacterChunker : public ChunkerBase {
public:
    explicit CharacterChunker(ChunkConfig config) : ChunkerBase(std::move(config)) {}

    std::vector<Chunk> chunk(const Artifact& artifact) const override;
    std::string provider() const override { return "character"; }

    std::vector<std::string> split_text(const std::string& text) const;
};

// Packs whole sentences into chunks of at most tokens_per_chunk whitespace
// tokens; chunk_overlap is measured in tokens.
class SentenceTokenChunker : public ChunkerBase {
public:
    explicit SentenceTokenChunker(ChunkConfig config);

    std::vector<Chunk> chunk(const Artifact& artifact) const override;
    std::string provider() const override { return "sentence_token"; }

    std::vector<std::string> split_text(const std::string& text) const;
};

// One chunk per markdown section under #, ## and ### headers.
class MarkdownChunker : public ChunkerBase {
public:
    explicit MarkdownChunker(ChunkConfig config) : ChunkerBase(std::move(config)) {}

    std::vector<Chunk> chunk(const Artifact& artifact) const override;
    std::string provider() const override { return "markdown"; }

    struct Section {
        std::string header_1;
        std::string header_2;
        std::string header_3;
        std::string content;
    };
    std::vector<Section> split_sections(const std::string& text) const;
};

// Line based packing that prefers sentence, paragraph, header and list
// boundaries, with whole-line overlap.
class SmartChunker : public ChunkerBase {
public:
    explicit SmartChunker(ChunkConfig config) : ChunkerBase(std::move(config)) {}

    std::vector<Chunk> chunk(const Artifact& artifact) const override;
    std::string provider() const override { return "smart"; }

    std::vector<std::string> split_text(const std::string& text) const;

    static bool is_good_split_point(const std::string& line);
    static std::string clean_content(const std::string& content);
    static std::string clean_chunk(const std::string& chunk);

private:
    size_t find_best_split_point(const std::vector<std::string>& lines, size_t target_size) const;
    std::vector<std::string> overlap_lines(const std::vector<std::string>& lines) const;
    std::string join_lines(const std::vector<std::string>& lines) const;
};

} // namespace workspace_rag
