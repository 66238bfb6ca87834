#include "rerank/reranker.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "rerank/bm25_reranker.hpp"
#include "rerank/http_reranker.hpp"

namespace workspace_rag {

void finalize_rerank_results(std::vector<RerankResult>& results,
                             std::optional<double> score_threshold,
                             std::optional<int> top_n) {
    if (score_threshold) {
        double threshold = *score_threshold;
        results.erase(std::remove_if(results.begin(), results.end(),
                                     [threshold](const RerankResult& r) { return r.score < threshold; }),
                      results.end());
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const RerankResult& a, const RerankResult& b) { return a.score > b.score; });
    if (top_n && *top_n >= 0 && results.size() > static_cast<size_t>(*top_n)) {
        results.resize(static_cast<size_t>(*top_n));
    }
}

std::shared_ptr<RerankRunner> make_reranker(const RerankConfig& config) {
    using Factory = std::function<std::shared_ptr<RerankRunner>(const RerankConfig&)>;
    static const std::map<std::string, Factory> factories = {
        {"bm25", [](const RerankConfig& c) { return std::make_shared<BM25RerankRunner>(c.k1, c.b); }},
        {"http", [](const RerankConfig& c) { return std::make_shared<HttpRerankRunner>(c); }},
    };

    auto it = factories.find(config.provider);
    if (it == factories.end()) {
        throw std::invalid_argument("Unsupported rerank provider: " + config.provider);
    }
    spdlog::info("📊 Rerank provider: {}", config.provider);
    return it->second(config);
}

} // namespace workspace_rag
