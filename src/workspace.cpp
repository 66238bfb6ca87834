#include "workspace.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace workspace_rag {

using json = nlohmann::json;

StorageConfig storage_for_workspace(const StorageConfig& base, const std::string& workspace_id) {
    validate_storage_id(workspace_id, "workspace id");
    StorageConfig scoped = base;
    if (base.provider == "local") {
        std::string root = base.storage_path;
        while (!root.empty() && root.back() == '/') root.pop_back();
        scoped.storage_path = root.empty() ? workspace_id : root + "/" + workspace_id;
    } else {
        std::string prefix = base.prefix;
        while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
        scoped.prefix = prefix.empty() ? workspace_id : prefix + "/" + workspace_id;
    }
    return scoped;
}

Workspace::Workspace(std::string workspace_id,
                     std::string name,
                     WorkspaceConfig config,
                     std::shared_ptr<Repository> repository,
                     std::shared_ptr<Embeddings> embeddings,
                     std::shared_ptr<VectorDB> vector_db,
                     std::shared_ptr<RerankRunner> reranker,
                     std::shared_ptr<WorkspaceEvents> events)
    : workspace_id_(std::move(workspace_id)),
      name_(std::move(name)),
      config_(std::move(config)),
      created_at_(now_iso8601()),
      updated_at_(created_at_),
      repository_(std::move(repository)),
      embeddings_(std::move(embeddings)),
      vector_db_(std::move(vector_db)),
      events_(events ? std::move(events) : std::make_shared<WorkspaceEvents>()) {
    if (workspace_id_.empty()) throw std::invalid_argument("workspace_id must not be empty");
    if (!repository_) throw std::invalid_argument("Workspace requires a repository");
    if (name_.empty()) name_ = workspace_id_;

    if (config_.chunk.enabled) chunker_ = make_chunker(config_.chunk);

    if (embeddings_ && vector_db_) {
        engine_ = std::make_unique<RetrievalEngine>(
            workspace_id_, config_.hybrid_search, config_.reranker,
            embeddings_, vector_db_, repository_,
            config_.reranker.enabled ? std::move(reranker) : nullptr);
    }

    if (config_.storage.clear_existing) {
        if (vector_db_ && vector_db_->has_collection(workspace_id_)) {
            vector_db_->delete_collection(workspace_id_);
        }
        spdlog::info("🧹 Workspace {} starts empty", workspace_id_);
    } else {
        load();
    }
}

void Workspace::load() {
    auto index = repository_->get_index_data();
    if (!index || !index->contains("workspace") || !(*index)["workspace"].is_object()) {
        spdlog::info("📦 No stored state for workspace {}", workspace_id_);
        return;
    }
    const json& data = (*index)["workspace"];
    if (data.contains("name") && data["name"].is_string() && !data["name"].get<std::string>().empty()) {
        name_ = data["name"].get<std::string>();
    }
    created_at_ = data.value("created_at", created_at_);
    updated_at_ = data.value("updated_at", updated_at_);
    if (data.contains("metadata") && data["metadata"].is_object()) metadata_ = data["metadata"];

    std::vector<Artifact> loaded;
    for (const auto& entry : data.value("artifacts", json::array())) {
        std::string id = entry.value("artifact_id", entry.value("id", ""));
        if (id.empty()) continue;
        auto stored = repository_->retrieve_artifact(id);
        if (!stored) {
            spdlog::warn("⚠️ Workspace {} lists artifact {} but it is not stored", workspace_id_, id);
            continue;
        }
        auto artifact = Artifact::from_json(*stored);
        if (!artifact) {
            spdlog::warn("⚠️ Stored artifact {} has no id, skipped", id);
            continue;
        }
        loaded.push_back(std::move(*artifact));
    }

    std::unique_lock lock(artifacts_mutex_);
    artifacts_ = std::move(loaded);
    spdlog::info("✅ Loaded workspace {} with {} artifacts", workspace_id_, artifacts_.size());
}

bool Workspace::indexing_enabled() const {
    return config_.embedding.enabled && embeddings_ && vector_db_;
}

std::shared_ptr<std::mutex> Workspace::artifact_lock(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(artifact_locks_mutex_);
    auto& slot = artifact_locks_[artifact_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void Workspace::release_artifact_lock(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(artifact_locks_mutex_);
    artifact_locks_.erase(artifact_id);
}

size_t Workspace::artifact_lock_count() const {
    std::lock_guard<std::mutex> lock(artifact_locks_mutex_);
    return artifact_locks_.size();
}

Artifact Workspace::with_sub_content(const Artifact& sub) {
    Artifact copy = sub;
    if (copy.content().empty() && !copy.parent_id().empty()) {
        if (auto content = repository_->get_subartifact_content(copy.artifact_id(), copy.parent_id())) {
            copy.restore_content(std::move(*content));
        }
    }
    return copy;
}

void Workspace::purge_vectors(const Artifact& artifact) {
    if (!vector_db_) return;
    vector_db_->remove(workspace_id_, {}, json{{"artifact_id", artifact.artifact_id()}});
    if (artifact.parent_id().empty()) {
        vector_db_->remove(workspace_id_, {}, json{{"parent_id", artifact.artifact_id()}});
    }
}

void Workspace::index_one(const Artifact& artifact) {
    auto artifact_mutex = artifact_lock(artifact.artifact_id());
    std::lock_guard<std::mutex> lock(*artifact_mutex);
    vector_db_->remove(workspace_id_, {}, json{{"artifact_id", artifact.artifact_id()}});

    if (!chunker_) {
        auto record = embeddings_->embed_artifact(artifact);
        if (record) vector_db_->upsert(workspace_id_, {*record});
        return;
    }

    auto chunks = chunker_->chunk(artifact);
    repository_->store_artifact_chunks(artifact, chunks);

    auto embedded = embeddings_->embed_chunks(chunks);
    if (!embedded.empty()) vector_db_->upsert(workspace_id_, embedded);
    if (embedded.size() < chunks.size()) {
        throw std::runtime_error(std::to_string(chunks.size() - embedded.size()) + " of " +
                                 std::to_string(chunks.size()) + " chunks of " + artifact.artifact_id() +
                                 " failed to embed");
    }
    spdlog::info("🧮 Indexed {} chunks of {}", embedded.size(), artifact.artifact_id());
}

void Workspace::index_artifact_tree(const Artifact& artifact) {
    if (!indexing_enabled()) return;

    std::exception_ptr first_error;
    auto run = [&](const Artifact& a) {
        try {
            index_one(a);
        } catch (const std::exception& e) {
            spdlog::error("❌ Indexing artifact {} failed: {}", a.artifact_id(), e.what());
            if (!first_error) first_error = std::current_exception();
        }
    };

    run(artifact);
    for (const auto& sub : artifact.sublist()) run(with_sub_content(sub));

    if (first_error) std::rethrow_exception(first_error);
}

Artifact Workspace::create_artifact(ArtifactType type,
                                    const std::string& artifact_id,
                                    const std::string& content,
                                    const json& metadata) {
    if (!metadata.is_object()) throw std::invalid_argument("metadata must be an object");
    return add_artifact(Artifact(type, content, ArtifactMetadata(metadata), artifact_id));
}

Artifact Workspace::add_artifact(Artifact artifact) {
    {
        std::unique_lock lock(artifacts_mutex_);
        auto dup = std::find_if(artifacts_.begin(), artifacts_.end(),
                                [&](const Artifact& a) { return a.artifact_id() == artifact.artifact_id(); });
        if (dup != artifacts_.end()) {
            throw std::invalid_argument("Artifact already exists: " + artifact.artifact_id());
        }
        artifacts_.push_back(artifact);
        updated_at_ = now_iso8601();
    }

    try {
        repository_->store_artifact(artifact);
    } catch (const std::exception& e) {
        spdlog::error("❌ Storing artifact {} failed, not added: {}", artifact.artifact_id(), e.what());
        std::unique_lock lock(artifacts_mutex_);
        artifacts_.erase(std::remove_if(artifacts_.begin(), artifacts_.end(),
                                        [&](const Artifact& a) { return a.artifact_id() == artifact.artifact_id(); }),
                         artifacts_.end());
        throw;
    }
    save();
    spdlog::info("✅ Added artifact {} ({}) to {}", artifact.artifact_id(), to_string(artifact.artifact_type()), workspace_id_);

    index_artifact_tree(artifact);
    events_->emit_create(workspace_id_, artifact);
    return artifact;
}

std::optional<Artifact> Workspace::update_artifact(const std::string& artifact_id,
                                                   const std::string& content,
                                                   const std::string& description) {
    std::optional<Artifact> updated;
    {
        std::unique_lock lock(artifacts_mutex_);
        for (auto& a : artifacts_) {
            if (a.artifact_id() != artifact_id) continue;
            a.update_content(content, description);
            updated = a;
            break;
        }
        if (!updated) return std::nullopt;
        updated_at_ = now_iso8601();
    }

    repository_->store_artifact(*updated);
    save();
    spdlog::info("✅ Updated artifact {} in {}", artifact_id, workspace_id_);

    index_artifact_tree(*updated);
    events_->emit_update(workspace_id_, *updated);
    return updated;
}

bool Workspace::delete_artifact(const std::string& artifact_id) {
    std::optional<Artifact> removed;
    {
        std::unique_lock lock(artifacts_mutex_);
        auto it = std::find_if(artifacts_.begin(), artifacts_.end(),
                               [&](const Artifact& a) { return a.artifact_id() == artifact_id; });
        if (it == artifacts_.end()) return false;
        it->archive();
        removed = std::move(*it);
        artifacts_.erase(it);
        updated_at_ = now_iso8601();
    }

    repository_->store_artifact(*removed);
    save();
    {
        auto artifact_mutex = artifact_lock(artifact_id);
        std::lock_guard<std::mutex> lock(*artifact_mutex);
        purge_vectors(*removed);
    }
    release_artifact_lock(artifact_id);
    for (const auto& sub : removed->sublist()) release_artifact_lock(sub.artifact_id());
    spdlog::info("🗑️ Archived artifact {} in {}", artifact_id, workspace_id_);

    events_->emit_delete(workspace_id_, *removed);
    return true;
}

std::optional<Artifact> Workspace::get_artifact(const std::string& artifact_id, const std::string& parent_id) {
    std::optional<Artifact> found;
    {
        std::shared_lock lock(artifacts_mutex_);
        const std::string& top_id = parent_id.empty() ? artifact_id : parent_id;
        auto it = std::find_if(artifacts_.begin(), artifacts_.end(),
                               [&](const Artifact& a) { return a.artifact_id() == top_id; });
        if (it == artifacts_.end()) return std::nullopt;
        if (parent_id.empty()) return *it;

        const Artifact* sub = it->find_subartifact(artifact_id);
        if (!sub) return std::nullopt;
        found = *sub;
    }
    return with_sub_content(*found);
}

std::vector<Artifact> Workspace::list_artifacts(const std::vector<ArtifactType>& filter_types) const {
    std::shared_lock lock(artifacts_mutex_);
    if (filter_types.empty()) return artifacts_;

    std::vector<Artifact> out;
    for (const auto& a : artifacts_) {
        if (std::find(filter_types.begin(), filter_types.end(), a.artifact_type()) != filter_types.end()) {
            out.push_back(a);
        }
    }
    return out;
}

size_t Workspace::artifact_count() const {
    std::shared_lock lock(artifacts_mutex_);
    return artifacts_.size();
}

void Workspace::save() {
    std::lock_guard<std::mutex> save_lock(save_mutex_);
    json data;
    {
        std::shared_lock lock(artifacts_mutex_);
        json ids = json::array();
        json entries = json::array();
        for (const auto& a : artifacts_) {
            ids.push_back(a.artifact_id());
            entries.push_back({
                {"artifact_id", a.artifact_id()},
                {"type", to_string(a.artifact_type())},
                {"metadata", a.metadata().to_json()}
            });
        }
        data = {
            {"workspace_id", workspace_id_},
            {"name", name_},
            {"created_at", created_at_},
            {"updated_at", updated_at_},
            {"metadata", metadata_},
            {"artifact_ids", ids},
            {"artifacts", entries}
        };
    }
    repository_->store_index(data);
    spdlog::info("💼 Saved workspace {}", workspace_id_);
}

namespace {

json build_tree_node(const Artifact& artifact, const std::string& parent_id, int depth) {
    json node = {
        {"name", artifact.metadata().get_string("filename").value_or(artifact.artifact_id())},
        {"id", artifact.artifact_id()},
        {"type", to_string(artifact.artifact_type())},
        {"artifactId", artifact.artifact_id()},
        {"parentId", parent_id},
        {"depth", depth},
        {"expanded", false},
        {"children", json::array()}
    };
    for (const auto& sub : artifact.sublist()) {
        node["children"].push_back(build_tree_node(sub, artifact.artifact_id(), depth + 1));
    }
    return node;
}

} // namespace

json Workspace::generate_tree_data() const {
    std::shared_lock lock(artifacts_mutex_);
    json children = json::array();
    for (const auto& a : artifacts_) children.push_back(build_tree_node(a, "-1", 1));
    return {{"name", name_}, {"id", "-1"}, {"type", "workspace"}, {"children", children}};
}

void Workspace::rebuild_index() {
    if (!indexing_enabled()) {
        spdlog::warn("⚠️ Embedding disabled for {}, nothing to rebuild", workspace_id_);
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();
    if (vector_db_->has_collection(workspace_id_)) vector_db_->delete_collection(workspace_id_);

    auto snapshot = list_artifacts();
    std::exception_ptr first_error;
    for (const auto& artifact : snapshot) {
        try {
            index_artifact_tree(artifact);
        } catch (const std::exception&) {
            if (!first_error) first_error = std::current_exception();
        }
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("🧮 Rebuilt index of {} ({} artifacts) in {:.2f} ms", workspace_id_, snapshot.size(), duration);
    if (first_error) std::rethrow_exception(first_error);
}

std::vector<ChunkSearchResult> Workspace::retrieve_chunk(const ChunkSearchQuery& query) {
    query.validate();
    if (!engine_) {
        spdlog::debug("🔍 Retrieval unavailable for {}: embedding disabled", workspace_id_);
        return {};
    }
    return engine_->retrieve_chunks(query);
}

std::vector<ArtifactSearchResult> Workspace::retrieve_artifact(const ArtifactSearchQuery& query) {
    query.validate();
    if (!engine_) return {};
    return engine_->retrieve_artifacts(query, [this](const std::string& id, const std::string& parent_id) {
        return get_artifact(id, parent_id);
    });
}

} // namespace workspace_rag
