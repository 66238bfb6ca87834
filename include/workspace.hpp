#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "artifact.hpp"
#include "chunk/chunker.hpp"
#include "embedding/embedding_service.hpp"
#include "rerank/reranker.hpp"
#include "retrieval_engine.hpp"
#include "storage/repository.hpp"
#include "vector/vector_store.hpp"
#include "workspace_config.hpp"
#include "workspace_events.hpp"

namespace workspace_rag {

// Storage settings scoped to one workspace: a sub-directory for local
// storage, a key prefix for object storage.
StorageConfig storage_for_workspace(const StorageConfig& base, const std::string& workspace_id);

// A named set of artifacts with their chunk index. The vector collection is
// named after the workspace id. Embeddings and vector store may be null when
// embedding is disabled.
class Workspace {
public:
    Workspace(std::string workspace_id,
              std::string name,
              WorkspaceConfig config,
              std::shared_ptr<Repository> repository,
              std::shared_ptr<Embeddings> embeddings,
              std::shared_ptr<VectorDB> vector_db,
              std::shared_ptr<RerankRunner> reranker = nullptr,
              std::shared_ptr<WorkspaceEvents> events = nullptr);

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    // Duplicate id -> std::invalid_argument. Indexing failures are rethrown
    // after the artifact has been stored and the workspace saved.
    Artifact create_artifact(ArtifactType type,
                             const std::string& artifact_id,
                             const std::string& content,
                             const nlohmann::json& metadata = nlohmann::json::object());
    Artifact add_artifact(Artifact artifact);

    std::optional<Artifact> update_artifact(const std::string& artifact_id,
                                            const std::string& content,
                                            const std::string& description = "Content update");
    bool delete_artifact(const std::string& artifact_id);

    // With a parent id the sub-artifact is returned with its content loaded
    // from the repository.
    std::optional<Artifact> get_artifact(const std::string& artifact_id, const std::string& parent_id = "");
    std::vector<Artifact> list_artifacts(const std::vector<ArtifactType>& filter_types = {}) const;

    void save();
    nlohmann::json generate_tree_data() const;

    // Drops the vector collection, then re-chunks and re-embeds every artifact.
    void rebuild_index();

    std::vector<ChunkSearchResult> retrieve_chunk(const ChunkSearchQuery& query);
    std::vector<ArtifactSearchResult> retrieve_artifact(const ArtifactSearchQuery& query);

    const std::string& workspace_id() const { return workspace_id_; }
    const std::string& name() const { return name_; }
    size_t artifact_count() const;
    size_t artifact_lock_count() const;
    WorkspaceEvents& events() { return *events_; }

private:
    void load();
    void index_artifact_tree(const Artifact& artifact);
    void index_one(const Artifact& artifact);
    void purge_vectors(const Artifact& artifact);
    Artifact with_sub_content(const Artifact& sub);
    std::shared_ptr<std::mutex> artifact_lock(const std::string& artifact_id);
    void release_artifact_lock(const std::string& artifact_id);
    bool indexing_enabled() const;

    std::string workspace_id_;
    std::string name_;
    WorkspaceConfig config_;
    std::string created_at_;
    std::string updated_at_;
    nlohmann::json metadata_ = nlohmann::json::object();

    std::shared_ptr<Repository> repository_;
    std::shared_ptr<Embeddings> embeddings_;
    std::shared_ptr<VectorDB> vector_db_;
    std::shared_ptr<WorkspaceEvents> events_;
    std::unique_ptr<Chunker> chunker_;
    std::unique_ptr<RetrievalEngine> engine_;

    std::vector<Artifact> artifacts_;
    mutable std::shared_mutex artifacts_mutex_;

    // Serializes index writes so the last save wins.
    std::mutex save_mutex_;

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> artifact_locks_;
    mutable std::mutex artifact_locks_mutex_;
};

} // namespace workspace_rag
