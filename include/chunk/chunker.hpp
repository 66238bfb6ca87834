#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "artifact.hpp"
#include "workspace_config.hpp"

namespace workspace_rag {

class Chunker {
public:
    virtual ~Chunker() = default;
    virtual std::vector<Chunk> chunk(const Artifact& artifact) const = 0;
    virtual std::string provider() const = 0;
};

// Shared numbering and metadata stamping. Every chunker hands its raw pieces
// to create_chunks, which assigns chunk_index 0..n-1.
class ChunkerBase : public Chunker {
public:
    explicit ChunkerBase(ChunkConfig config);

    const ChunkConfig& config() const { return config_; }

protected:
    std::vector<Chunk> create_chunks(const std::vector<std::string>& texts, const Artifact& artifact) const;

    ChunkConfig config_;
};

using ChunkerFactory = std::function<std::unique_ptr<Chunker>(const ChunkConfig&)>;

class ChunkerRegistry {
public:
    // character, sentence_token, markdown, smart
    static ChunkerRegistry with_defaults();

    void register_provider(const std::string& name, ChunkerFactory factory);
    bool has_provider(const std::string& name) const;
    std::vector<std::string> providers() const;

    // Throws std::invalid_argument for unknown providers.
    std::unique_ptr<Chunker> create(const ChunkConfig& config) const;

private:
    std::map<std::string, ChunkerFactory> factories_;
};

std::unique_ptr<Chunker> make_chunker(const ChunkConfig& config);

} // namespace workspace_rag
