#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "vector/faiss_vector_store.hpp"

using namespace workspace_rag;
using namespace workspace_rag::testing;
using json = nlohmann::json;

namespace {

EmbeddingsResult record(const std::string& id, std::vector<float> v,
                        const std::string& artifact_id, const std::string& type = "TEXT", int chunk_index = 0) {
    EmbeddingsResult r;
    r.id = id;
    r.embedding = std::move(v);
    r.content = "content of " + id;
    r.metadata.artifact_id = artifact_id;
    r.metadata.artifact_type = type;
    r.metadata.chunk_id = id;
    r.metadata.chunk_index = chunk_index;
    return r;
}

std::vector<EmbeddingsResult> three_records() {
    return {
        record("a", {1.0f, 0.0f, 0.0f}, "doc1", "TEXT", 0),
        record("b", {0.8f, 0.6f, 0.0f}, "doc1", "TEXT", 1),
        record("c", {0.0f, 1.0f, 0.0f}, "doc2", "CODE", 0),
    };
}

} // namespace

TEST_CASE("Similarity normalization bounds", "[vector]") {
    REQUIRE(similarity_from_cosine_distance(0.0) == Approx(1.0));
    REQUIRE(similarity_from_cosine_distance(2.0) == Approx(0.0));
    REQUIRE(similarity_from_cosine_distance(1.0) == Approx(0.5));
    REQUIRE(similarity_from_cosine_distance(-0.5) == Approx(1.0));
    REQUIRE(similarity_from_cosine_distance(3.0) == Approx(0.0));
    for (double d = 0.0; d < 2.0; d += 0.25) {
        REQUIRE(similarity_from_cosine_distance(d) > similarity_from_cosine_distance(d + 0.25));
    }
}

TEST_CASE("Metadata filters match equality and membership", "[vector]") {
    EmbeddingsMetadata m;
    m.artifact_id = "doc1";
    m.artifact_type = "TEXT";
    m.chunk_index = 2;

    REQUIRE(m.matches(json::object()));
    REQUIRE(m.matches(json{{"artifact_id", "doc1"}}));
    REQUIRE(m.matches(json{{"artifact_type", {"CODE", "TEXT"}}}));
    REQUIRE(m.matches(json{{"chunk_index", 2}}));
    REQUIRE_FALSE(m.matches(json{{"artifact_id", "doc2"}}));
    REQUIRE_FALSE(m.matches(json{{"unknown_field", "x"}}));
}

TEST_CASE("Search ranks by cosine similarity", "[vector]") {
    FaissVectorStore store(3);
    store.insert("ws", three_records());
    REQUIRE(store.count("ws") == 3);

    auto found = store.search("ws", {{2.0f, 0.0f, 0.0f}}, json::object(), 0.0, 10);
    REQUIRE(found.has_value());
    REQUIRE(found->docs.size() == 3);
    REQUIRE(found->docs[0].id == "a");
    REQUIRE(*found->docs[0].score == Approx(1.0).margin(1e-5));
    REQUIRE(found->docs[1].id == "b");
    REQUIRE(*found->docs[1].score == Approx(0.9).margin(1e-5));
    REQUIRE(found->docs[2].id == "c");
    REQUIRE(*found->docs[2].score == Approx(0.5).margin(1e-5));
    REQUIRE(found->retrieved_at > 0);
}

TEST_CASE("Search honors threshold limit and filter", "[vector]") {
    FaissVectorStore store(3);
    store.insert("ws", three_records());
    std::vector<std::vector<float>> query = {{1.0f, 0.0f, 0.0f}};

    SECTION("threshold") {
        auto found = store.search("ws", query, json::object(), 0.8, 10);
        REQUIRE(found->docs.size() == 2);
        for (const auto& d : found->docs) REQUIRE(*d.score >= 0.8);
    }
    SECTION("limit") {
        auto found = store.search("ws", query, json::object(), 0.0, 1);
        REQUIRE(found->docs.size() == 1);
        REQUIRE(found->docs[0].id == "a");
    }
    SECTION("filter") {
        auto found = store.search("ws", query, json{{"artifact_id", "doc2"}}, 0.0, 10);
        REQUIRE(found->docs.size() == 1);
        REQUIRE(found->docs[0].id == "c");
    }
    SECTION("missing collection") {
        REQUIRE_FALSE(store.search("other", query, json::object(), 0.0, 10).has_value());
    }
    SECTION("dimension mismatch") {
        REQUIRE_THROWS_AS(store.search("ws", {{1.0f, 0.0f}}, json::object(), 0.0, 10), std::invalid_argument);
    }
}

TEST_CASE("Insert rejects duplicates and upsert replaces", "[vector]") {
    FaissVectorStore store(3);
    store.insert("ws", three_records());

    REQUIRE_THROWS_AS(store.insert("ws", {record("a", {0.0f, 0.0f, 1.0f}, "doc1")}), std::invalid_argument);

    store.upsert("ws", {record("a", {0.0f, 0.0f, 1.0f}, "doc1")});
    REQUIRE(store.count("ws") == 3);
    auto found = store.search("ws", {{0.0f, 0.0f, 1.0f}}, json::object(), 0.0, 1);
    REQUIRE(found->docs[0].id == "a");
    REQUIRE(*found->docs[0].score == Approx(1.0).margin(1e-5));
}

TEST_CASE("Remove by ids, by filter and whole collection", "[vector]") {
    FaissVectorStore store(3);
    store.insert("ws", three_records());

    store.remove("ws", {"c"});
    REQUIRE(store.count("ws") == 2);

    store.remove("ws", {}, json{{"artifact_id", "doc1"}});
    REQUIRE(store.count("ws") == 0);
    REQUIRE(store.has_collection("ws"));

    store.remove("ws", {});
    REQUIRE_FALSE(store.has_collection("ws"));
}

TEST_CASE("Query lists records in insertion order", "[vector]") {
    FaissVectorStore store(3);
    store.insert("ws", three_records());

    auto all = store.get("ws");
    REQUIRE(all->docs.size() == 3);
    REQUIRE(all->docs[0].id == "a");
    REQUIRE(all->docs[2].id == "c");

    auto code = store.query("ws", json{{"artifact_type", "CODE"}}, 10);
    REQUIRE(code->docs.size() == 1);
    REQUIRE(code->docs[0].metadata.artifact_id == "doc2");
}

TEST_CASE("Collections persist across instances", "[vector]") {
    TempDir dir;
    {
        FaissVectorStore store(3, dir.str());
        store.insert("ws", three_records());
        store.remove("ws", {"b"});
    }

    FaissVectorStore reopened(3, dir.str());
    REQUIRE(reopened.count("ws") == 2);
    auto found = reopened.search("ws", {{0.0f, 1.0f, 0.0f}}, json::object(), 0.0, 1);
    REQUIRE(found->docs[0].id == "c");
    REQUIRE(found->docs[0].metadata.artifact_type == "CODE");

    reopened.upsert("ws", {record("d", {0.0f, 0.0f, 1.0f}, "doc3")});
    REQUIRE(reopened.count("ws") == 3);

    reopened.delete_collection("ws");
    FaissVectorStore empty(3, dir.str());
    REQUIRE_FALSE(empty.has_collection("ws"));
}

TEST_CASE("Unknown vector provider is rejected", "[vector]") {
    VectorDBConfig config;
    config.provider = "chroma";
    REQUIRE_THROWS_AS(make_vector_db(config, 3), std::invalid_argument);
    config.provider = "faiss";
    REQUIRE(make_vector_db(config, 3) != nullptr);
}
