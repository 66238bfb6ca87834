#include <catch2/catch.hpp>
#include <cmath>
#include "rerank/bm25_reranker.hpp"
#include "rerank/reranker.hpp"

using namespace workspace_rag;

TEST_CASE("BM25 tokenizer", "[rerank]") {
    auto tokens = BM25RerankRunner::tokenize("Hello, World! snake_case 42x");
    REQUIRE(tokens == std::vector<std::string>{"hello", "world", "snake_case", "42x"});

    REQUIRE(BM25RerankRunner::tokenize("  ...  ").empty());
    REQUIRE(BM25RerankRunner::tokenize("caf\xC3\xA9 bar") == std::vector<std::string>{"caf\xC3\xA9", "bar"});
}

TEST_CASE("BM25 tokenizer on non-ASCII text", "[rerank]") {
    SECTION("CJK punctuation separates tokens") {
        // "你好，世界。"
        auto tokens = BM25RerankRunner::tokenize("\xE4\xBD\xA0\xE5\xA5\xBD\xEF\xBC\x8C\xE4\xB8\x96\xE7\x95\x8C\xE3\x80\x82");
        REQUIRE(tokens == std::vector<std::string>{"\xE4\xBD\xA0\xE5\xA5\xBD", "\xE4\xB8\x96\xE7\x95\x8C"});
    }
    SECTION("accented capitals are lower-cased") {
        // "ÉTÉ Café" -> "été", "café"
        auto tokens = BM25RerankRunner::tokenize("\xC3\x89T\xC3\x89 Caf\xC3\xA9");
        REQUIRE(tokens == std::vector<std::string>{"\xC3\xA9t\xC3\xA9", "caf\xC3\xA9"});
    }
    SECTION("ill-formed bytes separate tokens") {
        REQUIRE(BM25RerankRunner::tokenize("ab\xFF" "cd") == std::vector<std::string>{"ab", "cd"});
    }
    SECTION("non-ASCII query terms score") {
        BM25RerankRunner bm25;
        auto ranked = bm25.run("\xE4\xB8\x96\xE7\x95\x8C",
                               {"\xE5\xA4\xA9\xE6\xB0\x94\xE5\xBE\x88\xE5\xA5\xBD",
                                "\xE4\xBD\xA0\xE5\xA5\xBD\xEF\xBC\x8C\xE4\xB8\x96\xE7\x95\x8C"});
        REQUIRE(ranked.size() == 2);
        REQUIRE(ranked[0].index == 1);
        REQUIRE(ranked[0].score > 0.0);

        auto accented = bm25.run("\xC3\xA9t\xC3\xA9", {"\xC3\x89T\xC3\x89 report", "winter report"});
        REQUIRE(accented[0].index == 0);
        REQUIRE(accented[0].score > 0.0);
    }
}

TEST_CASE("BM25 corpus statistics", "[rerank]") {
    auto stats = BM25RerankRunner::build_corpus({"a b a", "b c", ""});
    REQUIRE(stats.document_count == 3);
    REQUIRE(stats.lengths == std::vector<size_t>{3, 2, 0});
    REQUIRE(stats.average_length == Approx(5.0 / 3.0));
    REQUIRE(stats.term_frequencies[0].at("a") == 2);
    REQUIRE(stats.document_frequencies.at("b") == 2);
    REQUIRE(stats.document_frequencies.at("c") == 1);

    BM25RerankRunner bm25;
    REQUIRE(bm25.idf(stats, "c") == Approx(std::log((3.0 - 1.0 + 0.5) / 1.5 + 1.0)));
    REQUIRE(bm25.idf(stats, "zzz") == 0.0);
    REQUIRE(bm25.idf(stats, "c") > bm25.idf(stats, "b"));
}

TEST_CASE("BM25 scores", "[rerank]") {
    BM25RerankRunner bm25;

    SECTION("documents without query terms score zero") {
        auto stats = BM25RerankRunner::build_corpus({"red fox", "blue whale"});
        REQUIRE(bm25.score_document({"fox"}, stats, 1) == 0.0);
        REQUIRE(bm25.score_document({"fox"}, stats, 0) > 0.0);
        REQUIRE(bm25.score_document({"fox"}, stats, 7) == 0.0);
    }
    SECTION("more occurrences at equal length score higher") {
        auto stats = BM25RerankRunner::build_corpus({"fox fox fox x", "fox y y x", "z z z z"});
        REQUIRE(bm25.score_document({"fox"}, stats, 0) > bm25.score_document({"fox"}, stats, 1));
    }
    SECTION("longer documents are penalized") {
        auto stats = BM25RerankRunner::build_corpus({"fox", "fox a b c d e f g", "z"});
        REQUIRE(bm25.score_document({"fox"}, stats, 0) > bm25.score_document({"fox"}, stats, 1));
    }
    SECTION("no length normalization when b is zero") {
        BM25RerankRunner flat(1.2, 0.0);
        auto stats = BM25RerankRunner::build_corpus({"fox", "fox a b c d e f g", "z"});
        REQUIRE(flat.score_document({"fox"}, stats, 0) == Approx(flat.score_document({"fox"}, stats, 1)));
    }
    SECTION("empty corpus") {
        auto stats = BM25RerankRunner::build_corpus({"", ""});
        REQUIRE(bm25.score_document({"fox"}, stats, 0) == 0.0);
    }
}

TEST_CASE("BM25 rerank run orders and filters", "[rerank]") {
    BM25RerankRunner bm25;
    std::vector<std::string> docs = {
        "the weather is mild",
        "rust borrow checker and lifetimes",
        "lifetimes lifetimes in rust",
    };

    auto all = bm25.run("rust lifetimes", docs);
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].index == 2);
    REQUIRE(all[1].index == 1);
    REQUIRE(all[2].index == 0);
    REQUIRE(all[2].score == 0.0);

    auto positive = bm25.run("rust lifetimes", docs, 0.01);
    REQUIRE(positive.size() == 2);

    auto top = bm25.run("rust lifetimes", docs, std::nullopt, 1);
    REQUIRE(top.size() == 1);
    REQUIRE(top[0].index == 2);

    REQUIRE(bm25.run("anything", {}).empty());
}

TEST_CASE("BM25 parameters are validated", "[rerank]") {
    REQUIRE_THROWS_AS(BM25RerankRunner(-0.1, 0.5), std::invalid_argument);
    REQUIRE_THROWS_AS(BM25RerankRunner(1.2, 1.5), std::invalid_argument);
    REQUIRE_NOTHROW(BM25RerankRunner(0.0, 1.0));
}

TEST_CASE("Rerank result finalization", "[rerank]") {
    std::vector<RerankResult> results = {{0, 0.2}, {1, 0.9}, {2, 0.5}, {3, 0.9}};

    SECTION("stable descending order") {
        finalize_rerank_results(results, std::nullopt, std::nullopt);
        REQUIRE(results.size() == 4);
        REQUIRE(results[0].index == 1);
        REQUIRE(results[1].index == 3);
        REQUIRE(results[2].index == 2);
        REQUIRE(results[3].index == 0);
    }
    SECTION("threshold then top_n") {
        finalize_rerank_results(results, 0.5, 2);
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].index == 1);
        REQUIRE(results[1].index == 3);
    }
}

TEST_CASE("Rerank provider registry", "[rerank]") {
    RerankConfig config;
    config.provider = "bm25";
    config.k1 = 2.0;
    auto runner = make_reranker(config);
    REQUIRE(runner->provider() == "bm25");
    REQUIRE(std::dynamic_pointer_cast<BM25RerankRunner>(runner)->k1() == 2.0);

    config.provider = "http";
    REQUIRE_THROWS_AS(make_reranker(config), std::invalid_argument);
    config.base_url = "http://127.0.0.1:9/rerank";
    REQUIRE(make_reranker(config)->provider() == "http");

    config.provider = "cohere";
    REQUIRE_THROWS_AS(make_reranker(config), std::invalid_argument);
}
