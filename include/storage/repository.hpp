#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "artifact.hpp"
#include "workspace_config.hpp"

namespace workspace_rag {

struct ChunkWindow {
    std::vector<Chunk> pre_n_chunks;   // nearest first: i-1, i-2, ...
    std::optional<Chunk> target;
    std::vector<Chunk> next_n_chunks;  // i+1, i+2, ...

    bool found() const { return target.has_value(); }
};

// Persists artifact trees and chunk sequences under a fixed key grammar shared
// by every backend:
//
//   index.json, versions/index_his_{unix_seconds}.json
//   artifacts/{artifact_id}/index.json
//   artifacts/{artifact_id}/sublist/{sub_id}/origin.{ext}
//   artifacts/{artifact_id}/chunks/{artifact_id}_chunk_{n}.json
//   artifacts/{parent_id}/sublist/{artifact_id}/chunks/{artifact_id}_chunk_{n}.json
//   artifacts/{artifact_id}/attachment_files/{file_name}
//
// Reads return std::nullopt / empty on a miss. Backend failures throw
// std::runtime_error. The repository does not lock; callers serialize chunk
// rewrites per artifact.
class Repository {
public:
    virtual ~Repository() = default;

    std::optional<nlohmann::json> get_index_data();
    void store_index(const nlohmann::json& data);

    void store_artifact(const Artifact& artifact,
                        bool save_sub_list_content = true,
                        bool save_attachment_files = true);
    std::optional<nlohmann::json> retrieve_artifact(const std::string& artifact_id);
    std::optional<std::string> get_subartifact_content(const std::string& artifact_id,
                                                       const std::string& parent_id);
    // Raw bytes.
    std::optional<std::string> get_attachment_file(const std::string& artifact_id,
                                                   const std::string& file_name);

    // Replaces the whole chunk set of the artifact.
    virtual void store_artifact_chunks(const Artifact& artifact, const std::vector<Chunk>& chunks) = 0;

    ChunkWindow get_chunk_window(const std::string& artifact_id,
                                 const std::string& parent_id,
                                 int chunk_index,
                                 int pre_n,
                                 int next_n);

    // Unordered; std::nullopt when the chunk directory does not exist.
    std::optional<std::vector<Chunk>> get_chunks(const std::string& artifact_id,
                                                 const std::string& parent_id);

    virtual std::string backend_name() const = 0;

    // --- key grammar ---
    static std::string index_key() { return "index.json"; }
    static std::string index_history_key(int64_t unix_seconds);
    static std::string artifact_dir(const std::string& artifact_id);
    static std::string artifact_index_key(const std::string& artifact_id);
    static std::string sub_dir(const std::string& artifact_id, const std::string& sub_id);
    static std::string sub_data_key(const std::string& artifact_id, const std::string& sub_id,
                                    const std::string& ext = "txt");
    static std::string chunk_dir(const std::string& artifact_id, const std::string& parent_id);
    static std::string chunk_key(const std::string& artifact_id, const std::string& parent_id, int chunk_index);
    static std::string attachment_key(const std::string& artifact_id, const std::string& file_name);

protected:
    // Primitives over relative keys using '/' separators.
    virtual std::optional<std::string> read_object(const std::string& key) = 0;
    virtual void write_object(const std::string& key, const std::string& data) = 0;
    virtual bool object_exists(const std::string& key) = 0;
    virtual void move_object(const std::string& from, const std::string& to) = 0;
    // Keys of the objects directly under `dir`; std::nullopt when `dir` is absent.
    virtual std::optional<std::vector<std::string>> list_dir(const std::string& dir) = 0;

    std::optional<nlohmann::json> read_json(const std::string& key);
    std::optional<Chunk> read_chunk(const std::string& key);
};

// local | object | memory. Throws std::invalid_argument for anything else or
// for incomplete object store settings.
std::shared_ptr<Repository> make_repository(const StorageConfig& config);

} // namespace workspace_rag
