#include "workspace_config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace workspace_rag {

using json = nlohmann::json;

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

bool parse_bool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value == "true" || value == "1" || value == "yes";
}

} // namespace

// --- ChunkConfig ---

void ChunkConfig::validate() const {
    if (chunk_size <= 0) throw std::invalid_argument("chunk_size must be positive");
    if (chunk_overlap < 0) throw std::invalid_argument("chunk_overlap must not be negative");
    if (chunk_overlap > chunk_size) {
        throw std::invalid_argument("chunk_overlap (" + std::to_string(chunk_overlap) +
                                    ") exceeds chunk_size (" + std::to_string(chunk_size) + ")");
    }
    if (tokens_per_chunk <= 0) throw std::invalid_argument("tokens_per_chunk must be positive");
    if (provider.empty()) throw std::invalid_argument("chunk provider must not be empty");
}

json ChunkConfig::to_json() const {
    return json{
        {"enabled", enabled},
        {"provider", provider},
        {"chunk_size", chunk_size},
        {"chunk_overlap", chunk_overlap},
        {"chunk_separator", chunk_separator},
        {"tokens_per_chunk", tokens_per_chunk}
    };
}

ChunkConfig ChunkConfig::from_json(const json& j) {
    ChunkConfig c;
    if (!j.is_object()) return c;
    c.enabled = j.value("enabled", c.enabled);
    c.provider = j.value("provider", c.provider);
    c.chunk_size = j.value("chunk_size", c.chunk_size);
    c.chunk_overlap = j.value("chunk_overlap", c.chunk_overlap);
    c.chunk_separator = j.value("chunk_separator", c.chunk_separator);
    c.tokens_per_chunk = j.value("tokens_per_chunk", c.tokens_per_chunk);
    return c;
}

// --- EmbeddingsConfig ---

void EmbeddingsConfig::validate() const {
    if (!enabled) return;
    if (base_url.empty()) throw std::invalid_argument("embedding.base_url is required when embedding is enabled");
    if (dimensions <= 0) throw std::invalid_argument("embedding.dimensions must be positive");
    if (context_length <= 0) throw std::invalid_argument("embedding.context_length must be positive");
    if (max_concurrent <= 0) throw std::invalid_argument("embedding.max_concurrent must be positive");
    if (timeout_seconds <= 0) throw std::invalid_argument("embedding.timeout_seconds must be positive");
}

json EmbeddingsConfig::to_json() const {
    return json{
        {"enabled", enabled},
        {"provider", provider},
        {"model_name", model_name},
        {"base_url", base_url},
        {"dimensions", dimensions},
        {"context_length", context_length},
        {"batch_size", batch_size},
        {"timeout_seconds", timeout_seconds},
        {"max_concurrent", max_concurrent}
    };
}

EmbeddingsConfig EmbeddingsConfig::from_json(const json& j) {
    EmbeddingsConfig c;
    if (!j.is_object()) return c;
    c.enabled = j.value("enabled", c.enabled);
    c.provider = j.value("provider", c.provider);
    c.model_name = j.value("model_name", c.model_name);
    c.base_url = j.value("base_url", c.base_url);
    c.api_key = j.value("api_key", c.api_key);
    c.dimensions = j.value("dimensions", c.dimensions);
    c.context_length = j.value("context_length", c.context_length);
    c.batch_size = j.value("batch_size", c.batch_size);
    c.timeout_seconds = j.value("timeout_seconds", c.timeout_seconds);
    c.max_concurrent = j.value("max_concurrent", c.max_concurrent);
    return c;
}

// --- VectorDBConfig ---

void VectorDBConfig::validate() const {
    if (provider.empty()) throw std::invalid_argument("vector_db.provider must not be empty");
}

json VectorDBConfig::to_json() const {
    return json{{"provider", provider}, {"data_path", data_path}};
}

VectorDBConfig VectorDBConfig::from_json(const json& j) {
    VectorDBConfig c;
    if (!j.is_object()) return c;
    c.provider = j.value("provider", c.provider);
    c.data_path = j.value("data_path", c.data_path);
    return c;
}

// --- HybridSearchConfig ---

json HybridSearchConfig::to_json() const {
    return json{{"enabled", enabled}, {"top_k", top_k}, {"threshold", threshold}};
}

HybridSearchConfig HybridSearchConfig::from_json(const json& j) {
    HybridSearchConfig c;
    if (!j.is_object()) return c;
    c.enabled = j.value("enabled", c.enabled);
    c.top_k = j.value("top_k", c.top_k);
    c.threshold = j.value("threshold", c.threshold);
    return c;
}

// --- RerankConfig ---

void RerankConfig::validate() const {
    if (!enabled) return;
    if (provider == "http" && base_url.empty()) {
        throw std::invalid_argument("reranker.base_url is required for the http reranker");
    }
    if (k1 < 0.0) throw std::invalid_argument("reranker.k1 must not be negative");
    if (b < 0.0 || b > 1.0) throw std::invalid_argument("reranker.b must be within [0, 1]");
    if (top_n && *top_n <= 0) throw std::invalid_argument("reranker.top_n must be positive");
}

json RerankConfig::to_json() const {
    json j = {
        {"enabled", enabled},
        {"provider", provider},
        {"base_url", base_url},
        {"model_name", model_name},
        {"k1", k1},
        {"b", b}
    };
    j["score_threshold"] = score_threshold ? json(*score_threshold) : json(nullptr);
    j["top_n"] = top_n ? json(*top_n) : json(nullptr);
    return j;
}

RerankConfig RerankConfig::from_json(const json& j) {
    RerankConfig c;
    if (!j.is_object()) return c;
    c.enabled = j.value("enabled", c.enabled);
    c.provider = j.value("provider", c.provider);
    c.base_url = j.value("base_url", c.base_url);
    c.api_key = j.value("api_key", c.api_key);
    c.model_name = j.value("model_name", c.model_name);
    c.k1 = j.value("k1", c.k1);
    c.b = j.value("b", c.b);
    if (j.contains("score_threshold") && j["score_threshold"].is_number()) {
        c.score_threshold = j["score_threshold"].get<double>();
    }
    if (j.contains("top_n") && j["top_n"].is_number_integer()) {
        c.top_n = j["top_n"].get<int>();
    }
    return c;
}

// --- StorageConfig ---

void StorageConfig::validate() const {
    if (provider == "local") {
        if (storage_path.empty()) throw std::invalid_argument("storage.storage_path is required for local storage");
    } else if (provider == "object") {
        if (endpoint.empty()) throw std::invalid_argument("storage.endpoint is required for object storage");
        if (bucket.empty()) throw std::invalid_argument("storage.bucket is required for object storage");
    } else if (provider != "memory") {
        throw std::invalid_argument("Unsupported storage provider: " + provider);
    }
}

json StorageConfig::to_json() const {
    return json{
        {"provider", provider},
        {"storage_path", storage_path},
        {"clear_existing", clear_existing},
        {"endpoint", endpoint},
        {"bucket", bucket},
        {"prefix", prefix}
    };
}

StorageConfig StorageConfig::from_json(const json& j) {
    StorageConfig c;
    if (!j.is_object()) return c;
    c.provider = j.value("provider", c.provider);
    c.storage_path = j.value("storage_path", c.storage_path);
    c.clear_existing = j.value("clear_existing", c.clear_existing);
    c.endpoint = j.value("endpoint", c.endpoint);
    c.bucket = j.value("bucket", c.bucket);
    c.prefix = j.value("prefix", c.prefix);
    c.access_token = j.value("access_token", c.access_token);
    return c;
}

// --- WorkspaceConfig ---

void WorkspaceConfig::validate() const {
    chunk.validate();
    embedding.validate();
    vector_db.validate();
    reranker.validate();
    storage.validate();
    if (hybrid_search.threshold < 0.0 || hybrid_search.threshold > 1.0) {
        throw std::invalid_argument("hybrid_search.threshold must be within [0, 1]");
    }
    if (hybrid_search.top_k <= 0) throw std::invalid_argument("hybrid_search.top_k must be positive");
}

json WorkspaceConfig::to_json() const {
    return json{
        {"chunk", chunk.to_json()},
        {"embedding", embedding.to_json()},
        {"vector_db", vector_db.to_json()},
        {"hybrid_search", hybrid_search.to_json()},
        {"reranker", reranker.to_json()},
        {"storage", storage.to_json()},
        {"log_level", log_level},
        {"server_host", server_host},
        {"server_port", server_port}
    };
}

WorkspaceConfig WorkspaceConfig::from_json(const json& j) {
    WorkspaceConfig c;
    if (!j.is_object()) return c;
    if (j.contains("chunk")) c.chunk = ChunkConfig::from_json(j["chunk"]);
    if (j.contains("embedding")) c.embedding = EmbeddingsConfig::from_json(j["embedding"]);
    if (j.contains("vector_db")) c.vector_db = VectorDBConfig::from_json(j["vector_db"]);
    if (j.contains("hybrid_search")) c.hybrid_search = HybridSearchConfig::from_json(j["hybrid_search"]);
    if (j.contains("reranker")) c.reranker = RerankConfig::from_json(j["reranker"]);
    if (j.contains("storage")) c.storage = StorageConfig::from_json(j["storage"]);
    c.log_level = j.value("log_level", c.log_level);
    c.server_host = j.value("server_host", c.server_host);
    c.server_port = j.value("server_port", c.server_port);
    return c;
}

void apply_env_overrides(WorkspaceConfig& config) {
    if (auto v = env_or_null("WORKSPACE_RAG_DATA_DIR")) config.storage.storage_path = v;
    if (auto v = env_or_null("WORKSPACE_RAG_EMBEDDING_BASE_URL")) config.embedding.base_url = v;
    if (auto v = env_or_null("WORKSPACE_RAG_EMBEDDING_API_KEY")) config.embedding.api_key = v;
    if (auto v = env_or_null("WORKSPACE_RAG_EMBEDDING_MODEL")) config.embedding.model_name = v;
    if (auto v = env_or_null("WORKSPACE_RAG_RERANKER_BASE_URL")) config.reranker.base_url = v;
    if (auto v = env_or_null("WORKSPACE_RAG_RERANKER_API_KEY")) config.reranker.api_key = v;
    if (auto v = env_or_null("WORKSPACE_RAG_OBJECT_STORE_ENDPOINT")) config.storage.endpoint = v;
    if (auto v = env_or_null("WORKSPACE_RAG_OBJECT_STORE_BUCKET")) config.storage.bucket = v;
    if (auto v = env_or_null("WORKSPACE_RAG_OBJECT_STORE_TOKEN")) config.storage.access_token = v;
    if (auto v = env_or_null("WORKSPACE_RAG_ENABLE_HYBRID_SEARCH")) config.hybrid_search.enabled = parse_bool(v);
}

WorkspaceConfig load_workspace_config(const std::string& path) {
    std::vector<std::string> search_paths;
    if (!path.empty()) {
        search_paths.push_back(path);
    } else {
        search_paths = {
            "workspace_rag.json",
            "../workspace_rag.json",
            "config/workspace_rag.json"
        };
    }

    std::ifstream f;
    std::string found_path;
    for (const auto& candidate : search_paths) {
        f.open(candidate);
        if (f.is_open()) {
            found_path = candidate;
            break;
        }
    }

    WorkspaceConfig config;
    if (found_path.empty()) {
        if (!path.empty()) {
            throw std::invalid_argument("Config file not found: " + path);
        }
        spdlog::warn("⚠️ No workspace_rag.json found, using defaults");
    } else {
        json j;
        try {
            j = json::parse(f);
        } catch (const json::parse_error& e) {
            spdlog::error("❌ Failed to parse config {}: {}", found_path, e.what());
            throw std::invalid_argument("Malformed config file " + found_path + ": " + e.what());
        }
        config = WorkspaceConfig::from_json(j);
        spdlog::info("⚙️ Loaded configuration from {}", found_path);
    }

    apply_env_overrides(config);
    config.validate();
    return config;
}

} // namespace workspace_rag
