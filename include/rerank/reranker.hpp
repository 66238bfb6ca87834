#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "workspace_config.hpp"

namespace workspace_rag {

struct RerankResult {
    size_t index = 0;  // position in the documents passed to run()
    double score = 0.0;
};

// Second-stage scorer over an already narrowed candidate set. Results are
// sorted by score descending, filtered by the threshold and cut to top_n.
class RerankRunner {
public:
    virtual ~RerankRunner() = default;

    virtual std::vector<RerankResult> run(const std::string& query,
                                          const std::vector<std::string>& documents,
                                          std::optional<double> score_threshold = std::nullopt,
                                          std::optional<int> top_n = std::nullopt) = 0;

    virtual std::string provider() const = 0;
};

// Sorts, applies the threshold and truncates in place.
void finalize_rerank_results(std::vector<RerankResult>& results,
                             std::optional<double> score_threshold,
                             std::optional<int> top_n);

// bm25 | http. Throws std::invalid_argument for unknown providers.
std::shared_ptr<RerankRunner> make_reranker(const RerankConfig& config);

} // namespace workspace_rag
