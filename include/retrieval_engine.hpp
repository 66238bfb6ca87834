#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "artifact.hpp"
#include "embedding/embedding_service.hpp"
#include "rerank/reranker.hpp"
#include "storage/repository.hpp"
#include "vector/vector_store.hpp"
#include "workspace_config.hpp"

namespace workspace_rag {

// Looks up a live artifact by (artifact_id, parent_id); parent_id is empty for
// top-level artifacts.
using ArtifactResolver =
    std::function<std::optional<Artifact>(const std::string& artifact_id, const std::string& parent_id)>;

// Dense search over one vector collection, expanded to chunk windows from the
// repository and optionally rescored by a reranker.
class RetrievalEngine {
public:
    RetrievalEngine(std::string collection_id,
                    HybridSearchConfig hybrid_config,
                    RerankConfig rerank_config,
                    std::shared_ptr<Embeddings> embeddings,
                    std::shared_ptr<VectorDB> vector_db,
                    std::shared_ptr<Repository> repository,
                    std::shared_ptr<RerankRunner> reranker = nullptr);

    // Throws std::invalid_argument for an invalid query before any backend
    // call. Without a reranker every result has score >= query.threshold;
    // with one, results are ordered by rerank score and filtered by the
    // rerank score threshold. At most query.limit results.
    std::vector<ChunkSearchResult> retrieve_chunks(const ChunkSearchQuery& query);

    std::vector<ArtifactSearchResult> retrieve_artifacts(const ArtifactSearchQuery& query,
                                                         const ArtifactResolver& resolver);

    const std::string& collection_id() const { return collection_id_; }
    bool has_reranker() const { return reranker_ != nullptr; }

private:
    std::vector<EmbeddingsResult> dense_search(const std::string& text,
                                               const nlohmann::json& filter,
                                               double threshold,
                                               int limit);
    void rerank(const std::string& query, std::vector<ChunkSearchResult>& results);

    std::string collection_id_;
    HybridSearchConfig hybrid_config_;
    RerankConfig rerank_config_;
    std::shared_ptr<Embeddings> embeddings_;
    std::shared_ptr<VectorDB> vector_db_;
    std::shared_ptr<Repository> repository_;
    std::shared_ptr<RerankRunner> reranker_;
};

} // namespace workspace_rag
