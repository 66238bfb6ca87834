#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "rerank/reranker.hpp"

namespace workspace_rag {

// Okapi BM25 with corpus statistics built from exactly the candidates passed
// to run():
//
//   score(D, Q) = sum_t idf(t) * tf * (k1 + 1) / (tf + k1 * (1 - b + b * |D| / avgdl))
//   idf(t)      = ln((N - df + 0.5) / (df + 0.5) + 1)
//
// Query terms absent from every candidate contribute nothing.
class BM25RerankRunner : public RerankRunner {
public:
    struct CorpusStats {
        size_t document_count = 0;
        double average_length = 0.0;
        std::vector<size_t> lengths;
        std::vector<std::unordered_map<std::string, size_t>> term_frequencies;
        std::unordered_map<std::string, size_t> document_frequencies;
    };

    explicit BM25RerankRunner(double k1 = 1.2, double b = 0.75);

    std::vector<RerankResult> run(const std::string& query,
                                  const std::vector<std::string>& documents,
                                  std::optional<double> score_threshold = std::nullopt,
                                  std::optional<int> top_n = std::nullopt) override;

    std::string provider() const override { return "bm25"; }

    // Lower-cased runs of Unicode letters, digits and '_' in UTF-8 text.
    // Everything else, CJK punctuation included, separates tokens.
    static std::vector<std::string> tokenize(const std::string& text);
    static CorpusStats build_corpus(const std::vector<std::string>& documents);

    double idf(const CorpusStats& stats, const std::string& term) const;
    double score_document(const std::vector<std::string>& query_terms,
                          const CorpusStats& stats,
                          size_t document) const;

    double k1() const { return k1_; }
    double b() const { return b_; }

private:
    double k1_;
    double b_;
};

} // namespace workspace_rag
