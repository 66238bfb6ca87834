#include "storage/object_storage_repository.hpp"
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace workspace_rag {

ObjectStorageRepository::ObjectStorageRepository(std::shared_ptr<ObjectStore> store, std::string prefix)
    : store_(std::move(store)), prefix_(std::move(prefix)) {
    if (!store_) throw std::invalid_argument("ObjectStorageRepository requires an object store");
    while (!prefix_.empty() && prefix_.back() == '/') prefix_.pop_back();
}

std::string ObjectStorageRepository::full_key(const std::string& key) const {
    return prefix_.empty() ? key : prefix_ + "/" + key;
}

std::string ObjectStorageRepository::relative_key(const std::string& key) const {
    if (prefix_.empty()) return key;
    return key.substr(prefix_.size() + 1);
}

std::optional<std::string> ObjectStorageRepository::read_object(const std::string& key) {
    return store_->get(full_key(key));
}

void ObjectStorageRepository::write_object(const std::string& key, const std::string& data) {
    store_->put(full_key(key), data);
}

bool ObjectStorageRepository::object_exists(const std::string& key) {
    return store_->exists(full_key(key));
}

// No server-side rename; copy then delete.
void ObjectStorageRepository::move_object(const std::string& from, const std::string& to) {
    auto data = store_->get(full_key(from));
    if (!data) return;
    store_->put(full_key(to), *data);
    store_->remove(full_key(from));
}

std::optional<std::vector<std::string>> ObjectStorageRepository::list_dir(const std::string& dir) {
    std::string dir_prefix = full_key(dir) + "/";
    auto all = store_->list(dir_prefix);
    if (all.empty()) return std::nullopt;

    std::vector<std::string> keys;
    for (const auto& key : all) {
        if (key.find('/', dir_prefix.size()) != std::string::npos) continue;
        keys.push_back(relative_key(key));
    }
    return keys;
}

void ObjectStorageRepository::store_artifact_chunks(const Artifact& artifact, const std::vector<Chunk>& chunks) {
    const auto& id = artifact.artifact_id();
    const auto& parent_id = artifact.parent_id();

    std::unordered_set<std::string> fresh;
    try {
        for (const auto& chunk : chunks) {
            auto key = chunk_key(id, parent_id, chunk.chunk_metadata.chunk_index);
            write_object(key, chunk.to_json().dump(2));
            fresh.insert(key);
        }

        size_t pruned = 0;
        if (auto existing = list_dir(chunk_dir(id, parent_id))) {
            for (const auto& key : *existing) {
                if (fresh.count(key)) continue;
                store_->remove(full_key(key));
                ++pruned;
            }
        }
        spdlog::info("✅ [object] Stored {} chunks for {} (pruned {} stale)", chunks.size(), id, pruned);
    } catch (const std::exception& e) {
        spdlog::error("❌ [object] Chunk rewrite for {} failed after {} writes: {}", id, fresh.size(), e.what());
        throw std::runtime_error(std::string("Chunk rewrite failed: ") + e.what());
    }
}

} // namespace workspace_rag
