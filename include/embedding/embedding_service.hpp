#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include "worker_pool.hpp"
#include "artifact.hpp"
#include "cache_manager.hpp"
#include "vector/vector_store.hpp"
#include "workspace_config.hpp"

namespace workspace_rag {

// Cuts `str` to at most `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

class Embeddings {
public:
    explicit Embeddings(EmbeddingsConfig config);
    virtual ~Embeddings();

    virtual std::vector<float> embed_query(const std::string& text) = 0;
    std::future<std::vector<float>> embed_query_async(const std::string& text);

    // At most max_concurrent calls in flight. Output keeps input order; a
    // chunk whose call fails is logged and left out.
    std::vector<EmbeddingsResult> embed_chunks(const std::vector<Chunk>& chunks);

    // Whole-artifact record; std::nullopt when the artifact has no text.
    std::optional<EmbeddingsResult> embed_artifact(const Artifact& artifact);

    const std::string& model_name() const { return config_.model_name; }
    const EmbeddingsConfig& config() const { return config_; }

protected:
    EmbeddingsConfig config_;
    std::unique_ptr<WorkerPool> pool_;
};

// Shared request path: cache lookup, retry on 429/503, timeout, dimension check.
class HttpEmbeddings : public Embeddings {
public:
    explicit HttpEmbeddings(EmbeddingsConfig config);

    std::vector<float> embed_query(const std::string& text) override;

    size_t cached_count() const { return cache_manager_->size(); }

protected:
    virtual std::string endpoint_url() const = 0;
    virtual nlohmann::json build_payload(const std::string& text) const = 0;
    virtual std::vector<float> parse_embedding(const nlohmann::json& response) const = 0;
    virtual cpr::Header headers() const;

    std::shared_ptr<CacheManager> cache_manager_;
};

// POST {base_url}/api/embed {model, input} -> {embeddings: [[...]]}
class OllamaEmbeddings : public HttpEmbeddings {
public:
    explicit OllamaEmbeddings(EmbeddingsConfig config) : HttpEmbeddings(std::move(config)) {}

protected:
    std::string endpoint_url() const override;
    nlohmann::json build_payload(const std::string& text) const override;
    std::vector<float> parse_embedding(const nlohmann::json& response) const override;
};

// POST {base_url}/embeddings {model, input} -> {data: [{embedding: [...]}]}
class OpenAICompatibleEmbeddings : public HttpEmbeddings {
public:
    explicit OpenAICompatibleEmbeddings(EmbeddingsConfig config) : HttpEmbeddings(std::move(config)) {}

protected:
    std::string endpoint_url() const override;
    nlohmann::json build_payload(const std::string& text) const override;
    std::vector<float> parse_embedding(const nlohmann::json& response) const override;
    cpr::Header headers() const override;
};

// ollama | openai. Throws std::invalid_argument for unknown providers or a
// missing base URL.
std::shared_ptr<Embeddings> make_embeddings(const EmbeddingsConfig& config);

} // namespace workspace_rag
