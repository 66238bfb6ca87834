#pragma once

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include "rerank/reranker.hpp"

namespace workspace_rag {

// Remote rerank service.
//   POST base_url {model, query, documents, top_n?, score_threshold?}
//   -> {results|docs: [{index, score|relevance_score}, ...]}
// Threshold and top_n are applied again locally.
class HttpRerankRunner : public RerankRunner {
public:
    explicit HttpRerankRunner(RerankConfig config, int timeout_seconds = 30);

    std::vector<RerankResult> run(const std::string& query,
                                  const std::vector<std::string>& documents,
                                  std::optional<double> score_threshold = std::nullopt,
                                  std::optional<int> top_n = std::nullopt) override;

    std::string provider() const override { return "http"; }

    static std::vector<RerankResult> parse_response(const nlohmann::json& response, size_t document_count);

private:
    cpr::Header headers() const;

    RerankConfig config_;
    int timeout_seconds_;
};

} // namespace workspace_rag
