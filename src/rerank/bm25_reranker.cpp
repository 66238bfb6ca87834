#include "rerank/bm25_reranker.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace workspace_rag {

namespace {

// Letters, digits and '_' in any script, like a Unicode-aware \w.
bool is_word_char(UChar32 c) {
    return c == '_' || u_isalnum(c);
}

void append_utf8(std::string& out, UChar32 c) {
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, c);
    out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
}

} // namespace

BM25RerankRunner::BM25RerankRunner(double k1, double b) : k1_(k1), b_(b) {
    if (k1_ < 0.0) throw std::invalid_argument("BM25 k1 must not be negative");
    if (b_ < 0.0 || b_ > 1.0) throw std::invalid_argument("BM25 b must be within [0, 1]");
}

std::vector<std::string> BM25RerankRunner::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());

    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        // Ill-formed sequences come back negative and separate tokens.
        if (c >= 0 && is_word_char(c)) {
            append_utf8(current, u_tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

BM25RerankRunner::CorpusStats BM25RerankRunner::build_corpus(const std::vector<std::string>& documents) {
    CorpusStats stats;
    stats.document_count = documents.size();
    stats.lengths.reserve(documents.size());
    stats.term_frequencies.reserve(documents.size());

    size_t total_length = 0;
    for (const auto& doc : documents) {
        auto tokens = tokenize(doc);
        std::unordered_map<std::string, size_t> tf;
        for (const auto& t : tokens) ++tf[t];
        for (const auto& [term, count] : tf) ++stats.document_frequencies[term];

        total_length += tokens.size();
        stats.lengths.push_back(tokens.size());
        stats.term_frequencies.push_back(std::move(tf));
    }
    if (!documents.empty()) {
        stats.average_length = static_cast<double>(total_length) / static_cast<double>(documents.size());
    }
    return stats;
}

double BM25RerankRunner::idf(const CorpusStats& stats, const std::string& term) const {
    auto it = stats.document_frequencies.find(term);
    if (it == stats.document_frequencies.end()) return 0.0;
    double n = static_cast<double>(stats.document_count);
    double df = static_cast<double>(it->second);
    return std::log((n - df + 0.5) / (df + 0.5) + 1.0);
}

double BM25RerankRunner::score_document(const std::vector<std::string>& query_terms,
                                        const CorpusStats& stats,
                                        size_t document) const {
    if (document >= stats.document_count || stats.average_length <= 0.0) return 0.0;

    const auto& tf_map = stats.term_frequencies[document];
    const double length_ratio = static_cast<double>(stats.lengths[document]) / stats.average_length;

    double score = 0.0;
    for (const auto& term : query_terms) {
        if (!stats.document_frequencies.count(term)) continue;
        auto tf_it = tf_map.find(term);
        if (tf_it == tf_map.end()) continue;

        double tf = static_cast<double>(tf_it->second);
        double numerator = tf * (k1_ + 1.0);
        double denominator = tf + k1_ * (1.0 - b_ + b_ * length_ratio);
        score += idf(stats, term) * numerator / denominator;
    }
    return score;
}

std::vector<RerankResult> BM25RerankRunner::run(const std::string& query,
                                                const std::vector<std::string>& documents,
                                                std::optional<double> score_threshold,
                                                std::optional<int> top_n) {
    if (documents.empty()) return {};
    auto start = std::chrono::high_resolution_clock::now();

    auto stats = build_corpus(documents);
    auto query_terms = tokenize(query);

    std::vector<RerankResult> results;
    results.reserve(documents.size());
    for (size_t i = 0; i < documents.size(); ++i) {
        results.push_back({i, score_document(query_terms, stats, i)});
    }
    finalize_rerank_results(results, score_threshold, top_n);

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("📊 BM25 reranked {} documents -> {} in {:.2f} ms", documents.size(), results.size(), duration);
    return results;
}

} // namespace workspace_rag
