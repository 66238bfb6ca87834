#include "embedding/embedding_service.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "http_retry.hpp"

namespace workspace_rag {

using json = nlohmann::json;

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    // Step back to the lead byte of the last sequence and drop it if cut short.
    size_t lead = length;
    while (lead > 0 && (static_cast<unsigned char>(str[lead - 1]) & 0xC0) == 0x80) --lead;
    if (lead == 0) return std::string();
    unsigned char c = static_cast<unsigned char>(str[lead - 1]);
    size_t expected = 1;
    if (c >= 0xF0) expected = 4;
    else if (c >= 0xE0) expected = 3;
    else if (c >= 0xC0) expected = 2;
    if (lead - 1 + expected > length) return str.substr(0, lead - 1);
    return str.substr(0, length);
}

// --- Embeddings ---

Embeddings::Embeddings(EmbeddingsConfig config)
    : config_(std::move(config)),
      pool_(std::make_unique<WorkerPool>(static_cast<size_t>(std::max(1, config_.max_concurrent)))) {}

// Callers must let outstanding embed_query_async futures finish first.
Embeddings::~Embeddings() = default;

std::future<std::vector<float>> Embeddings::embed_query_async(const std::string& text) {
    return pool_->submit([this, text]() { return embed_query(text); });
}

std::vector<EmbeddingsResult> Embeddings::embed_chunks(const std::vector<Chunk>& chunks) {
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<std::future<std::vector<float>>> pending;
    pending.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        pending.push_back(pool_->submit([this, text = chunk.content]() { return embed_query(text); }));
    }

    std::vector<EmbeddingsResult> results;
    results.reserve(chunks.size());
    size_t failed = 0;
    const int64_t now = unix_now();

    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        try {
            EmbeddingsResult r;
            r.embedding = pending[i].get();
            r.id = chunk.chunk_id;
            r.content = chunk.content;
            r.metadata.artifact_id = chunk.chunk_metadata.artifact_id;
            r.metadata.artifact_type = chunk.chunk_metadata.artifact_type;
            r.metadata.parent_id = chunk.chunk_metadata.parent_artifact_id;
            r.metadata.chunk_id = chunk.chunk_id;
            r.metadata.chunk_index = chunk.chunk_metadata.chunk_index;
            r.metadata.chunk_size = chunk.chunk_metadata.chunk_size;
            r.metadata.chunk_overlap = chunk.chunk_metadata.chunk_overlap;
            r.metadata.embedding_model = config_.model_name;
            r.metadata.created_at = now;
            r.metadata.updated_at = now;
            results.push_back(std::move(r));
        } catch (const std::exception& e) {
            ++failed;
            spdlog::error("❌ Embedding failed for chunk {}: {}", chunk.chunk_id, e.what());
        }
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("🧮 Embedded {}/{} chunks in {:.2f} ms ({} failed)",
                 results.size(), chunks.size(), duration, failed);
    return results;
}

std::optional<EmbeddingsResult> Embeddings::embed_artifact(const Artifact& artifact) {
    auto text = artifact.embedding_text();
    if (!text) return std::nullopt;

    const int64_t now = unix_now();
    EmbeddingsResult r;
    r.id = artifact.artifact_id();
    r.embedding = embed_query(*text);
    r.content = *text;
    r.metadata.artifact_id = artifact.artifact_id();
    r.metadata.artifact_type = to_string(artifact.artifact_type());
    r.metadata.parent_id = artifact.parent_id();
    r.metadata.embedding_model = config_.model_name;
    r.metadata.created_at = now;
    r.metadata.updated_at = now;
    return r;
}

// --- HttpEmbeddings ---

HttpEmbeddings::HttpEmbeddings(EmbeddingsConfig config)
    : Embeddings(std::move(config)), cache_manager_(std::make_shared<CacheManager>()) {
    if (config_.base_url.empty()) {
        throw std::invalid_argument("Embedding provider " + config_.provider + " requires a base_url");
    }
    config_.base_url = trim_trailing_slash(config_.base_url);
}

cpr::Header HttpEmbeddings::headers() const {
    return cpr::Header{{"Content-Type", "application/json"}};
}

std::vector<float> HttpEmbeddings::embed_query(const std::string& raw_text) {
    std::string text = utf8_safe_substr(raw_text, static_cast<size_t>(config_.context_length));
    if (auto cached = cache_manager_->get_embedding(config_.model_name, text)) return *cached;

    auto start = std::chrono::high_resolution_clock::now();

    std::string payload = build_payload(text).dump(-1, ' ', false, json::error_handler_t::replace);
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{endpoint_url()},
                         cpr::Body{payload},
                         headers(),
                         cpr::Timeout{config_.timeout_seconds * 1000});
    }, "Embedding API");

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::debug("⏱️ Embedding call took {:.2f} ms", duration);

    if (!is_success(r)) {
        spdlog::error("❌ Embedding API Fatal Error [{}] at {}: {} {}",
                      r.status_code, endpoint_url(), r.error.message, r.text);
        throw std::runtime_error("Failed to generate embedding (status " + std::to_string(r.status_code) + ")");
    }

    std::vector<float> embedding;
    try {
        embedding = parse_embedding(json::parse(r.text));
    } catch (const json::exception& e) {
        spdlog::error("❌ Unexpected embedding response: {}", e.what());
        throw std::runtime_error(std::string("Malformed embedding response: ") + e.what());
    }

    if (static_cast<int>(embedding.size()) != config_.dimensions) {
        spdlog::error("❌ Model {} returned {} dimensions, configured {}",
                      config_.model_name, embedding.size(), config_.dimensions);
        throw std::runtime_error("Embedding dimension mismatch");
    }

    cache_manager_->set_embedding(config_.model_name, text, embedding);
    return embedding;
}

// --- Ollama ---

std::string OllamaEmbeddings::endpoint_url() const {
    return config_.base_url + "/api/embed";
}

json OllamaEmbeddings::build_payload(const std::string& text) const {
    return json{{"model", config_.model_name}, {"input", text}};
}

std::vector<float> OllamaEmbeddings::parse_embedding(const json& response) const {
    return response.at("embeddings").at(0).get<std::vector<float>>();
}

// --- OpenAI compatible ---

std::string OpenAICompatibleEmbeddings::endpoint_url() const {
    return config_.base_url + "/embeddings";
}

json OpenAICompatibleEmbeddings::build_payload(const std::string& text) const {
    return json{{"model", config_.model_name}, {"input", text}, {"dimensions", config_.dimensions}};
}

std::vector<float> OpenAICompatibleEmbeddings::parse_embedding(const json& response) const {
    return response.at("data").at(0).at("embedding").get<std::vector<float>>();
}

cpr::Header OpenAICompatibleEmbeddings::headers() const {
    cpr::Header h{{"Content-Type", "application/json"}};
    if (!config_.api_key.empty()) h["Authorization"] = "Bearer " + config_.api_key;
    return h;
}

// --- Registry ---

std::shared_ptr<Embeddings> make_embeddings(const EmbeddingsConfig& config) {
    using Factory = std::function<std::shared_ptr<Embeddings>(const EmbeddingsConfig&)>;
    static const std::map<std::string, Factory> factories = {
        {"ollama", [](const EmbeddingsConfig& c) { return std::make_shared<OllamaEmbeddings>(c); }},
        {"openai", [](const EmbeddingsConfig& c) { return std::make_shared<OpenAICompatibleEmbeddings>(c); }},
    };

    auto it = factories.find(config.provider);
    if (it == factories.end()) {
        throw std::invalid_argument("Unsupported embedding provider: " + config.provider);
    }
    spdlog::info("🧠 Embedding provider: {} ({})", config.provider, config.model_name);
    return it->second(config);
}

} // namespace workspace_rag
