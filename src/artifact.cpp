#include "artifact.hpp"
#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <cstdio>
#include <utility>

namespace workspace_rag {

using json = nlohmann::json;

namespace {

constexpr std::array<ArtifactType, 18> kAllTypes = {
    ArtifactType::TEXT, ArtifactType::CODE, ArtifactType::MARKDOWN, ArtifactType::HTML,
    ArtifactType::SVG, ArtifactType::JSON, ArtifactType::CSV, ArtifactType::TABLE,
    ArtifactType::CHART, ArtifactType::DIAGRAM, ArtifactType::MCP_CALL, ArtifactType::TOOL_CALL,
    ArtifactType::LLM_OUTPUT, ArtifactType::WEB_PAGES, ArtifactType::DIR, ArtifactType::CUSTOM,
    ArtifactType::NOVEL, ArtifactType::CHUNK
};

constexpr std::array<ArtifactStatus, 4> kAllStatuses = {
    ArtifactStatus::DRAFT, ArtifactStatus::COMPLETE, ArtifactStatus::EDITED, ArtifactStatus::ARCHIVED
};

// Python-era descriptors carry null for absent parents.
std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

std::string to_string(ArtifactType type) {
    switch (type) {
        case ArtifactType::TEXT: return "TEXT";
        case ArtifactType::CODE: return "CODE";
        case ArtifactType::MARKDOWN: return "MARKDOWN";
        case ArtifactType::HTML: return "HTML";
        case ArtifactType::SVG: return "SVG";
        case ArtifactType::JSON: return "JSON";
        case ArtifactType::CSV: return "CSV";
        case ArtifactType::TABLE: return "TABLE";
        case ArtifactType::CHART: return "CHART";
        case ArtifactType::DIAGRAM: return "DIAGRAM";
        case ArtifactType::MCP_CALL: return "MCP_CALL";
        case ArtifactType::TOOL_CALL: return "TOOL_CALL";
        case ArtifactType::LLM_OUTPUT: return "LLM_OUTPUT";
        case ArtifactType::WEB_PAGES: return "WEB_PAGES";
        case ArtifactType::DIR: return "DIR";
        case ArtifactType::CUSTOM: return "CUSTOM";
        case ArtifactType::NOVEL: return "NOVEL";
        case ArtifactType::CHUNK: return "CHUNK";
    }
    throw std::invalid_argument("Unknown artifact type value");
}

ArtifactType artifact_type_from_string(const std::string& name) {
    for (auto type : kAllTypes) {
        if (to_string(type) == name) return type;
    }
    throw std::invalid_argument("Unknown artifact type: " + name);
}

std::string to_string(ArtifactStatus status) {
    switch (status) {
        case ArtifactStatus::DRAFT: return "DRAFT";
        case ArtifactStatus::COMPLETE: return "COMPLETE";
        case ArtifactStatus::EDITED: return "EDITED";
        case ArtifactStatus::ARCHIVED: return "ARCHIVED";
    }
    throw std::invalid_argument("Unknown artifact status value");
}

ArtifactStatus artifact_status_from_string(const std::string& name) {
    for (auto status : kAllStatuses) {
        if (to_string(status) == name) return status;
    }
    throw std::invalid_argument("Unknown artifact status: " + name);
}

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);

    // version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return os.str();
}

// --- VersionRecord / AttachmentFile ---

json VersionRecord::to_json() const {
    return json{
        {"timestamp", timestamp},
        {"description", description},
        {"content", content},
        {"status", workspace_rag::to_string(status)}
    };
}

VersionRecord VersionRecord::from_json(const json& j) {
    VersionRecord record;
    record.timestamp = j.value("timestamp", "");
    record.description = j.value("description", "");
    record.content = string_or_empty(j, "content");
    record.status = artifact_status_from_string(j.value("status", "DRAFT"));
    return record;
}

json AttachmentFile::to_json() const {
    return json{{"file_name", file_name}, {"file_desc", file_desc}, {"file_path", file_path}};
}

AttachmentFile AttachmentFile::from_json(const json& j) {
    return AttachmentFile{j.value("file_name", ""), j.value("file_desc", ""), j.value("file_path", "")};
}

// --- ArtifactMetadata ---

ArtifactMetadata::ArtifactMetadata(json data) : data_(std::move(data)) {
    if (data_.is_null()) data_ = json::object();
    if (!data_.is_object()) {
        throw std::invalid_argument("Artifact metadata must be a JSON object");
    }
}

bool ArtifactMetadata::contains(const std::string& key) const {
    return data_.contains(key);
}

std::optional<std::string> ArtifactMetadata::get_string(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<int64_t> ArtifactMetadata::get_int(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<int64_t>();
}

std::string ArtifactMetadata::require_string(const std::string& key) const {
    auto value = get_string(key);
    if (!value) throw std::out_of_range("Missing metadata key: " + key);
    return *value;
}

void ArtifactMetadata::set(const std::string& key, json value) {
    data_[key] = std::move(value);
}

void ArtifactMetadata::merge(const json& patch) {
    if (!patch.is_object()) {
        throw std::invalid_argument("Metadata patch must be a JSON object");
    }
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        data_[it.key()] = it.value();
    }
}

// --- Chunk ---

json ChunkMetadata::to_json() const {
    return json{
        {"chunk_index", chunk_index},
        {"chunk_size", chunk_size},
        {"chunk_overlap", chunk_overlap},
        {"artifact_id", artifact_id},
        {"artifact_type", artifact_type},
        {"parent_artifact_id", parent_artifact_id}
    };
}

ChunkMetadata ChunkMetadata::from_json(const json& j) {
    ChunkMetadata meta;
    meta.chunk_index = j.value("chunk_index", 0);
    meta.chunk_size = j.value("chunk_size", 0);
    meta.chunk_overlap = j.value("chunk_overlap", 0);
    meta.artifact_id = string_or_empty(j, "artifact_id");
    meta.artifact_type = string_or_empty(j, "artifact_type");
    meta.parent_artifact_id = string_or_empty(j, "parent_artifact_id");
    return meta;
}

std::string Chunk::chunk_file_name() const {
    return chunk_file_name_at(chunk_metadata.artifact_id, chunk_metadata.chunk_index);
}

std::string Chunk::chunk_file_name_at(const std::string& artifact_id, int chunk_index) {
    return artifact_id + "_chunk_" + std::to_string(chunk_index) + ".json";
}

json Chunk::to_json() const {
    return json{
        {"chunk_id", chunk_id},
        {"chunk_metadata", chunk_metadata.to_json()},
        {"content", content}
    };
}

Chunk Chunk::from_json(const json& j) {
    Chunk chunk;
    chunk.chunk_id = j.at("chunk_id").get<std::string>();
    if (j.contains("chunk_metadata")) chunk.chunk_metadata = ChunkMetadata::from_json(j["chunk_metadata"]);
    chunk.content = string_or_empty(j, "content");
    return chunk;
}

void validate_storage_id(const std::string& id, const std::string& what) {
    if (id.empty() || id == "." || id == ".." || id.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        throw std::invalid_argument("Invalid " + what + ": '" + id + "'");
    }
}

// --- Artifact ---

Artifact::Artifact(ArtifactType type, std::string content, ArtifactMetadata metadata,
                   std::string artifact_id, std::string parent_id)
    : artifact_id_(artifact_id.empty() ? generate_uuid() : std::move(artifact_id)),
      parent_id_(std::move(parent_id)),
      artifact_type_(type),
      content_(std::move(content)),
      metadata_(std::move(metadata)),
      created_at_(now_iso8601()),
      updated_at_(created_at_) {
    validate_storage_id(artifact_id_, "artifact id");
    if (!parent_id_.empty()) validate_storage_id(parent_id_, "parent id");
    record_version("Initial version");
}

void Artifact::record_version(const std::string& description) {
    version_history_.push_back({now_iso8601(), description, content_, status_});
}

void Artifact::touch() {
    updated_at_ = now_iso8601();
}

void Artifact::update_content(const std::string& content, const std::string& description) {
    content_ = content;
    status_ = ArtifactStatus::EDITED;
    touch();
    record_version(description);
}

void Artifact::update_metadata(const json& patch) {
    metadata_.merge(patch);
    touch();
}

void Artifact::mark_complete() {
    status_ = ArtifactStatus::COMPLETE;
    touch();
    record_version("Marked as complete");
}

void Artifact::archive() {
    status_ = ArtifactStatus::ARCHIVED;
    touch();
    record_version("Artifact archived");
}

std::optional<VersionRecord> Artifact::get_version(size_t index) const {
    if (index >= version_history_.size()) return std::nullopt;
    return version_history_[index];
}

bool Artifact::revert_to_version(size_t index) {
    if (index >= version_history_.size()) return false;

    VersionRecord target = version_history_[index];
    content_ = target.content;
    status_ = target.status;
    touch();
    record_version("Reverted to version " + std::to_string(index));
    return true;
}

Artifact& Artifact::add_subartifact(Artifact sub) {
    sub.parent_id_ = artifact_id_;
    sublist_.push_back(std::move(sub));
    touch();
    return sublist_.back();
}

Artifact* Artifact::find_subartifact(const std::string& sub_id) {
    for (auto& sub : sublist_) {
        if (sub.artifact_id_ == sub_id) return &sub;
    }
    return nullptr;
}

const Artifact* Artifact::find_subartifact(const std::string& sub_id) const {
    for (const auto& sub : sublist_) {
        if (sub.artifact_id_ == sub_id) return &sub;
    }
    return nullptr;
}

std::optional<std::string> Artifact::embedding_text() const {
    if (content_.empty()) return std::nullopt;
    return content_;
}

json Artifact::to_json(bool include_history) const {
    json attachments = json::array();
    for (const auto& file : attachment_files_) attachments.push_back(file.to_json());

    json subs = json::array();
    for (const auto& sub : sublist_) subs.push_back(sub.to_json(false));

    json j = {
        {"artifact_id", artifact_id_},
        {"parent_id", parent_id_},
        {"artifact_type", workspace_rag::to_string(artifact_type_)},
        {"content", content_},
        {"metadata", metadata_.to_json()},
        {"created_at", created_at_},
        {"updated_at", updated_at_},
        {"status", workspace_rag::to_string(status_)},
        {"attachment_files", attachments},
        {"sublist", subs}
    };

    if (include_history) {
        json history = json::array();
        for (const auto& record : version_history_) history.push_back(record.to_json());
        j["version_history"] = history;
    }
    return j;
}

std::optional<Artifact> Artifact::from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;
    std::string id = string_or_empty(j, "artifact_id");
    if (id.empty()) return std::nullopt;

    ArtifactType type = artifact_type_from_string(j.value("artifact_type", "TEXT"));
    ArtifactMetadata metadata(j.contains("metadata") ? j["metadata"] : json::object());

    Artifact artifact(type, string_or_empty(j, "content"), std::move(metadata),
                      id, string_or_empty(j, "parent_id"));

    auto created = string_or_empty(j, "created_at");
    if (!created.empty()) artifact.created_at_ = created;
    auto updated = string_or_empty(j, "updated_at");
    if (!updated.empty()) artifact.updated_at_ = updated;

    if (j.contains("status") && j["status"].is_string()) {
        artifact.status_ = artifact_status_from_string(j["status"].get<std::string>());
    }

    if (j.contains("version_history") && j["version_history"].is_array()) {
        artifact.version_history_.clear();
        for (const auto& record : j["version_history"]) {
            artifact.version_history_.push_back(VersionRecord::from_json(record));
        }
    }

    if (j.contains("attachment_files") && j["attachment_files"].is_array()) {
        for (const auto& file : j["attachment_files"]) {
            artifact.attachment_files_.push_back(AttachmentFile::from_json(file));
        }
    }

    if (j.contains("sublist") && j["sublist"].is_array()) {
        for (const auto& sub_json : j["sublist"]) {
            auto sub = Artifact::from_json(sub_json);
            if (!sub) continue;
            sub->parent_id_ = artifact.artifact_id_;
            artifact.sublist_.push_back(std::move(*sub));
        }
    }
    return artifact;
}

// --- Queries ---

void ChunkSearchQuery::validate() const {
    if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::invalid_argument("query must not be empty");
    }
    if (limit <= 0) throw std::invalid_argument("limit must be positive");
    if (pre_n < 0 || next_n < 0) throw std::invalid_argument("pre_n and next_n must not be negative");
    if (threshold < 0.0 || threshold > 1.0) throw std::invalid_argument("threshold must be within [0, 1]");
    if (!filters.is_object()) throw std::invalid_argument("filters must be a JSON object");
}

json ChunkSearchQuery::to_json() const {
    return json{
        {"query", query},
        {"filters", filters},
        {"threshold", threshold},
        {"limit", limit},
        {"pre_n", pre_n},
        {"next_n", next_n}
    };
}

ChunkSearchQuery ChunkSearchQuery::from_json(const json& j) {
    if (!j.is_object() || !j.contains("query") || !j["query"].is_string()) {
        throw std::invalid_argument("missing required field: query");
    }
    ChunkSearchQuery q;
    q.query = j["query"].get<std::string>();
    if (j.contains("filters") && !j["filters"].is_null()) q.filters = j["filters"];
    q.threshold = j.value("threshold", q.threshold);
    q.limit = j.value("limit", q.limit);
    q.pre_n = j.value("pre_n", q.pre_n);
    q.next_n = j.value("next_n", q.next_n);
    return q;
}

json ChunkSearchResult::to_json() const {
    json pre = json::array();
    for (const auto& c : pre_n_chunks) pre.push_back(c.to_json());
    json next = json::array();
    for (const auto& c : next_n_chunks) next.push_back(c.to_json());
    return json{
        {"chunk", chunk.to_json()},
        {"pre_n_chunks", pre},
        {"next_n_chunks", next},
        {"score", score}
    };
}

void ArtifactSearchQuery::validate() const {
    if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::invalid_argument("query must not be empty");
    }
    if (limit <= 0) throw std::invalid_argument("limit must be positive");
    if (threshold < 0.0 || threshold > 1.0) throw std::invalid_argument("threshold must be within [0, 1]");
}

json ArtifactSearchResult::to_json() const {
    return json{{"artifact", artifact.to_json()}, {"score", score}};
}

} // namespace workspace_rag
