#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace workspace_rag {

enum class ArtifactType {
    TEXT,
    CODE,
    MARKDOWN,
    HTML,
    SVG,
    JSON,
    CSV,
    TABLE,
    CHART,
    DIAGRAM,
    MCP_CALL,
    TOOL_CALL,
    LLM_OUTPUT,
    WEB_PAGES,
    DIR,
    CUSTOM,
    NOVEL,
    CHUNK
};

std::string to_string(ArtifactType type);
// Throws std::invalid_argument for names outside the enumeration.
ArtifactType artifact_type_from_string(const std::string& name);

enum class ArtifactStatus { DRAFT, COMPLETE, EDITED, ARCHIVED };

std::string to_string(ArtifactStatus status);
ArtifactStatus artifact_status_from_string(const std::string& name);

std::string generate_uuid();
// Ids name storage directories: empty, ".", ".." or ids holding '/', '\\' or NUL
// throw std::invalid_argument.
void validate_storage_id(const std::string& id, const std::string& what);
std::string now_iso8601();

struct VersionRecord {
    std::string timestamp;
    std::string description;
    std::string content;
    ArtifactStatus status = ArtifactStatus::DRAFT;

    nlohmann::json to_json() const;
    static VersionRecord from_json(const nlohmann::json& j);
};

struct AttachmentFile {
    std::string file_name;
    std::string file_desc;
    std::string file_path;  // local source of the bytes copied into the repository

    nlohmann::json to_json() const;
    static AttachmentFile from_json(const nlohmann::json& j);
};

// Open string-keyed map. Lookups return std::optional so callers decide what
// a missing key means; require_* throws when the key must be present.
class ArtifactMetadata {
public:
    ArtifactMetadata() : data_(nlohmann::json::object()) {}
    explicit ArtifactMetadata(nlohmann::json data);

    bool contains(const std::string& key) const;
    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<int64_t> get_int(const std::string& key) const;
    std::string require_string(const std::string& key) const;

    void set(const std::string& key, nlohmann::json value);
    void merge(const nlohmann::json& patch);

    const nlohmann::json& to_json() const { return data_; }

private:
    nlohmann::json data_;
};

struct ChunkMetadata {
    int chunk_index = 0;
    int chunk_size = 0;
    int chunk_overlap = 0;
    std::string artifact_id;
    std::string artifact_type;
    std::string parent_artifact_id;

    nlohmann::json to_json() const;
    static ChunkMetadata from_json(const nlohmann::json& j);
};

struct Chunk {
    std::string chunk_id;
    ChunkMetadata chunk_metadata;
    std::string content;

    const std::string& artifact_id() const { return chunk_metadata.artifact_id; }
    const std::string& parent_artifact_id() const { return chunk_metadata.parent_artifact_id; }

    // {artifact_id}_chunk_{chunk_index}.json
    std::string chunk_file_name() const;
    static std::string chunk_file_name_at(const std::string& artifact_id, int chunk_index);

    nlohmann::json to_json() const;
    static Chunk from_json(const nlohmann::json& j);
};

class Artifact {
public:
    explicit Artifact(ArtifactType type,
                      std::string content = "",
                      ArtifactMetadata metadata = ArtifactMetadata(),
                      std::string artifact_id = "",
                      std::string parent_id = "");

    const std::string& artifact_id() const { return artifact_id_; }
    const std::string& parent_id() const { return parent_id_; }
    ArtifactType artifact_type() const { return artifact_type_; }
    ArtifactStatus status() const { return status_; }
    const std::string& content() const { return content_; }
    const std::string& created_at() const { return created_at_; }
    const std::string& updated_at() const { return updated_at_; }

    ArtifactMetadata& metadata() { return metadata_; }
    const ArtifactMetadata& metadata() const { return metadata_; }

    const std::vector<VersionRecord>& version_history() const { return version_history_; }
    const std::vector<Artifact>& sublist() const { return sublist_; }

    std::vector<Chunk>& chunk_list() { return chunk_list_; }
    const std::vector<Chunk>& chunk_list() const { return chunk_list_; }

    std::vector<AttachmentFile>& attachment_files() { return attachment_files_; }
    const std::vector<AttachmentFile>& attachment_files() const { return attachment_files_; }

    void update_content(const std::string& content, const std::string& description = "Content update");
    void update_metadata(const nlohmann::json& patch);
    void mark_complete();
    void archive();

    std::optional<VersionRecord> get_version(size_t index) const;
    bool revert_to_version(size_t index);

    // Sets content loaded lazily from storage; not a mutation, no history entry.
    void restore_content(std::string content) { content_ = std::move(content); }

    Artifact& add_subartifact(Artifact sub);
    Artifact* find_subartifact(const std::string& sub_id);
    const Artifact* find_subartifact(const std::string& sub_id) const;

    std::optional<std::string> embedding_text() const;
    std::optional<std::string> rerank_text() const { return embedding_text(); }

    nlohmann::json to_json(bool include_history = false) const;
    // Returns std::nullopt when artifact_id is absent.
    static std::optional<Artifact> from_json(const nlohmann::json& j);

private:
    void record_version(const std::string& description);
    void touch();

    std::string artifact_id_;
    std::string parent_id_;
    ArtifactType artifact_type_;
    std::string content_;
    ArtifactMetadata metadata_;
    std::string created_at_;
    std::string updated_at_;
    ArtifactStatus status_ = ArtifactStatus::DRAFT;
    std::vector<VersionRecord> version_history_;
    std::vector<Artifact> sublist_;
    std::vector<Chunk> chunk_list_;
    std::vector<AttachmentFile> attachment_files_;
};

// --- Query / result types ---

struct ChunkSearchQuery {
    std::string query;
    nlohmann::json filters = nlohmann::json::object();
    double threshold = 0.8;
    int limit = 10;
    int pre_n = 3;
    int next_n = 3;

    // Throws std::invalid_argument on empty query, non-positive limit,
    // negative window sizes or a threshold outside [0, 1].
    void validate() const;

    nlohmann::json to_json() const;
    static ChunkSearchQuery from_json(const nlohmann::json& j);
};

struct ChunkSearchResult {
    Chunk chunk;
    std::vector<Chunk> pre_n_chunks;
    std::vector<Chunk> next_n_chunks;
    double score = 0.0;

    nlohmann::json to_json() const;
};

struct ArtifactSearchQuery {
    std::string query;
    std::vector<ArtifactType> filter_types;
    double threshold = 0.8;
    int limit = 10;

    void validate() const;
};

struct ArtifactSearchResult {
    Artifact artifact;
    double score = 0.0;

    nlohmann::json to_json() const;
};

} // namespace workspace_rag
