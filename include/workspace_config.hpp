#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace workspace_rag {

struct ChunkConfig {
    bool enabled = false;
    std::string provider = "character";
    int chunk_size = 1000;
    int chunk_overlap = 100;
    std::string chunk_separator = "\n";
    int tokens_per_chunk = 256;

    // Throws std::invalid_argument when overlap exceeds chunk size.
    void validate() const;
    nlohmann::json to_json() const;
    static ChunkConfig from_json(const nlohmann::json& j);
};

struct EmbeddingsConfig {
    bool enabled = false;
    std::string provider = "ollama";
    std::string model_name = "nomic-embed-text";
    std::string base_url = "http://localhost:11434";
    std::string api_key;
    int dimensions = 768;
    int context_length = 8191;  // input is cut to this many bytes on a UTF-8 boundary
    int batch_size = 100;
    int timeout_seconds = 60;
    int max_concurrent = 10;

    void validate() const;
    nlohmann::json to_json() const;
    static EmbeddingsConfig from_json(const nlohmann::json& j);
};

struct VectorDBConfig {
    std::string provider = "faiss";
    std::string data_path;  // empty keeps collections in memory only

    void validate() const;
    nlohmann::json to_json() const;
    static VectorDBConfig from_json(const nlohmann::json& j);
};

struct HybridSearchConfig {
    bool enabled = false;
    int top_k = 10;
    double threshold = 0.8;

    nlohmann::json to_json() const;
    static HybridSearchConfig from_json(const nlohmann::json& j);
};

struct RerankConfig {
    bool enabled = false;
    std::string provider = "bm25";
    std::string base_url;
    std::string api_key;
    std::string model_name;
    double k1 = 1.2;
    double b = 0.75;
    std::optional<double> score_threshold;
    std::optional<int> top_n;

    void validate() const;
    nlohmann::json to_json() const;
    static RerankConfig from_json(const nlohmann::json& j);
};

struct StorageConfig {
    std::string provider = "local";  // local | object | memory
    std::string storage_path = "data/workspaces";
    bool clear_existing = false;

    // object store
    std::string endpoint;
    std::string bucket;
    std::string prefix;
    std::string access_token;

    void validate() const;
    nlohmann::json to_json() const;
    static StorageConfig from_json(const nlohmann::json& j);
};

struct WorkspaceConfig {
    ChunkConfig chunk;
    EmbeddingsConfig embedding;
    VectorDBConfig vector_db;
    HybridSearchConfig hybrid_search;
    RerankConfig reranker;
    StorageConfig storage;

    std::string log_level = "info";
    std::string server_host = "127.0.0.1";
    int server_port = 5002;

    void validate() const;
    nlohmann::json to_json() const;
    static WorkspaceConfig from_json(const nlohmann::json& j);
};

// Reads `path`, or the first of workspace_rag.json, ../workspace_rag.json,
// config/workspace_rag.json when `path` is empty. Missing file means defaults.
// Environment overrides are applied last, then the result is validated.
WorkspaceConfig load_workspace_config(const std::string& path = "");

void apply_env_overrides(WorkspaceConfig& config);

} // namespace workspace_rag
