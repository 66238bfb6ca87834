#include "retrieval_engine.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace workspace_rag {

using json = nlohmann::json;

RetrievalEngine::RetrievalEngine(std::string collection_id,
                                 HybridSearchConfig hybrid_config,
                                 RerankConfig rerank_config,
                                 std::shared_ptr<Embeddings> embeddings,
                                 std::shared_ptr<VectorDB> vector_db,
                                 std::shared_ptr<Repository> repository,
                                 std::shared_ptr<RerankRunner> reranker)
    : collection_id_(std::move(collection_id)),
      hybrid_config_(hybrid_config),
      rerank_config_(std::move(rerank_config)),
      embeddings_(std::move(embeddings)),
      vector_db_(std::move(vector_db)),
      repository_(std::move(repository)),
      reranker_(std::move(reranker)) {
    if (!embeddings_ || !vector_db_ || !repository_) {
        throw std::invalid_argument("RetrievalEngine requires embeddings, vector store and repository");
    }
}

std::vector<EmbeddingsResult> RetrievalEngine::dense_search(const std::string& text,
                                                            const json& filter,
                                                            double threshold,
                                                            int limit) {
    auto query_embedding = embeddings_->embed_query(text);
    auto found = vector_db_->search(collection_id_, {query_embedding}, filter, threshold, limit);
    if (!found) {
        spdlog::debug("🔍 Collection {} does not exist yet", collection_id_);
        return {};
    }
    return std::move(found->docs);
}

std::vector<ChunkSearchResult> RetrievalEngine::retrieve_chunks(const ChunkSearchQuery& query) {
    query.validate();
    if (!hybrid_config_.enabled) {
        spdlog::debug("🔍 Hybrid search disabled for {}", collection_id_);
        return {};
    }

    auto start = std::chrono::high_resolution_clock::now();

    // 1. Dense candidates; a reranker gets a wider pool to reorder
    int candidate_limit = reranker_ ? std::max(query.limit, hybrid_config_.top_k) : query.limit;
    auto hits = dense_search(query.query, query.filters, query.threshold, candidate_limit);

    // 2. Expand each hit to its chunk window
    std::vector<ChunkSearchResult> results;
    std::unordered_set<std::string> seen;
    for (const auto& hit : hits) {
        const auto& meta = hit.metadata;
        if (!meta.is_chunk() || meta.artifact_id.empty()) {
            spdlog::warn("⚠️ Skipping hit {} without chunk metadata", hit.id);
            continue;
        }
        if (!seen.insert(meta.chunk_id).second) continue;

        try {
            auto window = repository_->get_chunk_window(meta.artifact_id, meta.parent_id,
                                                        meta.chunk_index, query.pre_n, query.next_n);
            if (!window.found()) {
                spdlog::warn("⚠️ Chunk {} is indexed but missing from storage", meta.chunk_id);
                continue;
            }
            ChunkSearchResult r;
            r.chunk = std::move(*window.target);
            r.pre_n_chunks = std::move(window.pre_n_chunks);
            r.next_n_chunks = std::move(window.next_n_chunks);
            r.score = hit.score.value_or(0.0);
            results.push_back(std::move(r));
        } catch (const std::exception& e) {
            spdlog::error("❌ Failed to resolve chunk {}: {}", meta.chunk_id, e.what());
        }
    }

    // 3. Order
    std::stable_sort(results.begin(), results.end(),
                     [](const ChunkSearchResult& a, const ChunkSearchResult& b) { return a.score > b.score; });

    // 4. Rerank
    if (reranker_ && !results.empty()) rerank(query.query, results);

    if (results.size() > static_cast<size_t>(query.limit)) {
        results.resize(static_cast<size_t>(query.limit));
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("⏱️ Retrieval Pipeline Time: {:.2f} ms ({} hits -> {} results)", duration, hits.size(), results.size());
    return results;
}

void RetrievalEngine::rerank(const std::string& query, std::vector<ChunkSearchResult>& results) {
    std::vector<std::string> documents;
    documents.reserve(results.size());
    for (const auto& r : results) documents.push_back(r.chunk.content);

    auto ranked = reranker_->run(query, documents, rerank_config_.score_threshold, rerank_config_.top_n);

    std::vector<ChunkSearchResult> reordered;
    reordered.reserve(ranked.size());
    for (const auto& rr : ranked) {
        ChunkSearchResult r = results[rr.index];
        r.score = rr.score;
        reordered.push_back(std::move(r));
    }
    results = std::move(reordered);
}

std::vector<ArtifactSearchResult> RetrievalEngine::retrieve_artifacts(const ArtifactSearchQuery& query,
                                                                      const ArtifactResolver& resolver) {
    query.validate();
    if (!hybrid_config_.enabled) return {};

    auto start = std::chrono::high_resolution_clock::now();

    json filter = json::object();
    if (!query.filter_types.empty()) {
        json types = json::array();
        for (auto t : query.filter_types) types.push_back(to_string(t));
        filter["artifact_type"] = types;
    }

    // Several chunks of one artifact may hit; over-fetch before deduping.
    int candidate_limit = std::max(query.limit * 4, hybrid_config_.top_k);
    auto hits = dense_search(query.query, filter, query.threshold, candidate_limit);

    std::vector<ArtifactSearchResult> results;
    std::unordered_set<std::string> seen;
    for (const auto& hit : hits) {
        if (results.size() >= static_cast<size_t>(query.limit)) break;
        const auto& meta = hit.metadata;
        if (meta.artifact_id.empty() || !seen.insert(meta.artifact_id).second) continue;

        std::optional<Artifact> artifact;
        try {
            artifact = resolver(meta.artifact_id, meta.parent_id);
        } catch (const std::exception& e) {
            spdlog::error("❌ Failed to resolve artifact {}: {}", meta.artifact_id, e.what());
            continue;
        }
        if (!artifact) {
            spdlog::warn("⚠️ Indexed artifact {} no longer exists", meta.artifact_id);
            continue;
        }
        if (!query.filter_types.empty() &&
            std::find(query.filter_types.begin(), query.filter_types.end(), artifact->artifact_type()) ==
                query.filter_types.end()) {
            continue;
        }
        results.push_back(ArtifactSearchResult{std::move(*artifact), hit.score.value_or(0.0)});
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("⏱️ Artifact Retrieval Time: {:.2f} ms ({} results)", duration, results.size());
    return results;
}

} // namespace workspace_rag
