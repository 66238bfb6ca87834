#include "chunk/chunker.hpp"
#include "chunk/text_chunkers.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace workspace_rag {

ChunkerBase::ChunkerBase(ChunkConfig config) : config_(std::move(config)) {
    config_.validate();
}

std::vector<Chunk> ChunkerBase::create_chunks(const std::vector<std::string>& texts,
                                              const Artifact& artifact) const {
    std::vector<Chunk> chunks;
    chunks.reserve(texts.size());

    for (size_t i = 0; i < texts.size(); ++i) {
        Chunk chunk;
        chunk.chunk_id = artifact.artifact_id() + "_chunk_" + std::to_string(i);
        chunk.content = texts[i];
        chunk.chunk_metadata.chunk_index = static_cast<int>(i);
        chunk.chunk_metadata.chunk_size = static_cast<int>(texts[i].size());
        chunk.chunk_metadata.chunk_overlap = config_.chunk_overlap;
        chunk.chunk_metadata.artifact_id = artifact.artifact_id();
        chunk.chunk_metadata.artifact_type = to_string(artifact.artifact_type());
        chunk.chunk_metadata.parent_artifact_id = artifact.parent_id();
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

// --- Registry ---

ChunkerRegistry ChunkerRegistry::with_defaults() {
    ChunkerRegistry registry;
    registry.register_provider("character", [](const ChunkConfig& c) {
        return std::make_unique<CharacterChunker>(c);
    });
    registry.register_provider("sentence_token", [](const ChunkConfig& c) {
        return std::make_unique<SentenceTokenChunker>(c);
    });
    registry.register_provider("markdown", [](const ChunkConfig& c) {
        return std::make_unique<MarkdownChunker>(c);
    });
    registry.register_provider("smart", [](const ChunkConfig& c) {
        return std::make_unique<SmartChunker>(c);
    });
    return registry;
}

void ChunkerRegistry::register_provider(const std::string& name, ChunkerFactory factory) {
    factories_[name] = std::move(factory);
}

bool ChunkerRegistry::has_provider(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> ChunkerRegistry::providers() const {
    std::vector<std::string> names;
    for (const auto& [name, factory] : factories_) names.push_back(name);
    return names;
}

std::unique_ptr<Chunker> ChunkerRegistry::create(const ChunkConfig& config) const {
    auto it = factories_.find(config.provider);
    if (it == factories_.end()) {
        spdlog::error("❌ Unsupported chunk provider: {}", config.provider);
        throw std::invalid_argument("Unsupported chunk provider: " + config.provider);
    }
    return it->second(config);
}

std::unique_ptr<Chunker> make_chunker(const ChunkConfig& config) {
    static const ChunkerRegistry registry = ChunkerRegistry::with_defaults();
    return registry.create(config);
}

} // namespace workspace_rag
