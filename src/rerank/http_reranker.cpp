#include "rerank/http_reranker.hpp"
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "http_retry.hpp"

namespace workspace_rag {

using json = nlohmann::json;

HttpRerankRunner::HttpRerankRunner(RerankConfig config, int timeout_seconds)
    : config_(std::move(config)), timeout_seconds_(timeout_seconds) {
    if (config_.base_url.empty()) {
        throw std::invalid_argument("HTTP reranker requires a base_url");
    }
}

cpr::Header HttpRerankRunner::headers() const {
    cpr::Header h{{"Content-Type", "application/json"}};
    if (!config_.api_key.empty()) h["Authorization"] = "Bearer " + config_.api_key;
    return h;
}

std::vector<RerankResult> HttpRerankRunner::parse_response(const json& response, size_t document_count) {
    const json* items = nullptr;
    if (response.contains("results") && response["results"].is_array()) {
        items = &response["results"];
    } else if (response.contains("docs") && response["docs"].is_array()) {
        items = &response["docs"];
    } else {
        throw std::runtime_error("Rerank response has neither 'results' nor 'docs'");
    }

    std::vector<RerankResult> results;
    for (const auto& item : *items) {
        if (!item.contains("index")) continue;
        auto index = item["index"].get<int64_t>();
        if (index < 0 || static_cast<size_t>(index) >= document_count) {
            spdlog::warn("⚠️ Rerank result index {} out of range ({} documents)", index, document_count);
            continue;
        }
        double score = 0.0;
        if (item.contains("score")) {
            score = item["score"].get<double>();
        } else if (item.contains("relevance_score")) {
            score = item["relevance_score"].get<double>();
        } else {
            continue;
        }
        results.push_back({static_cast<size_t>(index), score});
    }
    return results;
}

std::vector<RerankResult> HttpRerankRunner::run(const std::string& query,
                                                const std::vector<std::string>& documents,
                                                std::optional<double> score_threshold,
                                                std::optional<int> top_n) {
    if (documents.empty()) return {};
    auto start = std::chrono::high_resolution_clock::now();

    json payload = {{"query", query}, {"documents", documents}};
    if (!config_.model_name.empty()) payload["model"] = config_.model_name;
    if (top_n) payload["top_n"] = *top_n;
    if (score_threshold) payload["score_threshold"] = *score_threshold;

    std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{config_.base_url},
                         cpr::Body{body},
                         headers(),
                         cpr::Timeout{timeout_seconds_ * 1000});
    }, "Rerank API");

    if (!is_success(r)) {
        spdlog::error("❌ Rerank API Error [{}] at {}: {} {}", r.status_code, config_.base_url, r.error.message, r.text);
        throw std::runtime_error("Rerank request failed (status " + std::to_string(r.status_code) + ")");
    }

    std::vector<RerankResult> results;
    try {
        results = parse_response(json::parse(r.text), documents.size());
    } catch (const json::exception& e) {
        spdlog::error("❌ Malformed rerank response: {}", e.what());
        throw std::runtime_error(std::string("Malformed rerank response: ") + e.what());
    }
    finalize_rerank_results(results, score_threshold, top_n);

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("📊 Remote rerank {} documents -> {} in {:.2f} ms", documents.size(), results.size(), duration);
    return results;
}

} // namespace workspace_rag
