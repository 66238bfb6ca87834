#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using namespace workspace_rag;
using namespace workspace_rag::testing;

namespace {

std::vector<Chunk> chunks_with(const std::vector<std::string>& contents) {
    std::vector<Chunk> chunks;
    for (size_t i = 0; i < contents.size(); ++i) {
        Chunk c;
        c.chunk_id = "doc1_chunk_" + std::to_string(i);
        c.content = contents[i];
        c.chunk_metadata.chunk_index = static_cast<int>(i);
        c.chunk_metadata.chunk_size = static_cast<int>(contents[i].size());
        c.chunk_metadata.artifact_id = "doc1";
        c.chunk_metadata.artifact_type = "TEXT";
        c.chunk_metadata.parent_artifact_id = "book";
        chunks.push_back(c);
    }
    return chunks;
}

} // namespace

TEST_CASE("UTF-8 safe truncation never splits a sequence", "[embedding]") {
    REQUIRE(utf8_safe_substr("hello", 10) == "hello");
    REQUIRE(utf8_safe_substr("hello", 3) == "hel");

    const std::string word = "caf\xC3\xA9!";  // "café!"
    REQUIRE(utf8_safe_substr(word, 5) == word.substr(0, 5));
    REQUIRE(utf8_safe_substr(word, 4) == "caf");

    const std::string euro = "a\xE2\x82\xAC";  // "a€"
    REQUIRE(utf8_safe_substr(euro, 3) == "a");
    REQUIRE(utf8_safe_substr(euro, 2) == "a");
    REQUIRE(utf8_safe_substr(euro, 4) == euro);
}

TEST_CASE("Chunk embedding keeps order and drops failures", "[embedding]") {
    KeywordEmbeddings embeddings;
    auto chunks = chunks_with({"apple pie", "banana FAIL", "cherry tart", "durian"});

    auto results = embeddings.embed_chunks(chunks);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].id == "doc1_chunk_0");
    REQUIRE(results[1].id == "doc1_chunk_2");
    REQUIRE(results[2].id == "doc1_chunk_3");
    REQUIRE(embeddings.calls() == 4);

    const auto& m = results[1].metadata;
    REQUIRE(m.artifact_id == "doc1");
    REQUIRE(m.parent_id == "book");
    REQUIRE(m.chunk_id == "doc1_chunk_2");
    REQUIRE(m.chunk_index == 2);
    REQUIRE(m.embedding_model == "keyword-test");
    REQUIRE(m.is_chunk());
    REQUIRE(results[1].content == "cherry tart");
    REQUIRE(results[1].embedding[2] == Approx(1.0f));
}

TEST_CASE("Chunk embedding of an empty list", "[embedding]") {
    KeywordEmbeddings embeddings;
    REQUIRE(embeddings.embed_chunks({}).empty());
    REQUIRE(embeddings.calls() == 0);
}

TEST_CASE("Artifact embedding uses the whole content", "[embedding]") {
    KeywordEmbeddings embeddings;

    Artifact empty(ArtifactType::TEXT, "", ArtifactMetadata(), "empty");
    REQUIRE_FALSE(embeddings.embed_artifact(empty).has_value());
    REQUIRE(embeddings.calls() == 0);

    Artifact doc(ArtifactType::CODE, "banana banana", ArtifactMetadata(), "doc1");
    auto record = embeddings.embed_artifact(doc);
    REQUIRE(record.has_value());
    REQUIRE(record->id == "doc1");
    REQUIRE(record->metadata.artifact_type == "CODE");
    REQUIRE_FALSE(record->metadata.is_chunk());
    REQUIRE(record->embedding[1] == Approx(2.0f));

    Artifact failing(ArtifactType::TEXT, "FAIL", ArtifactMetadata(), "bad");
    REQUIRE_THROWS_AS(embeddings.embed_artifact(failing), std::runtime_error);
}

TEST_CASE("Async query embedding", "[embedding]") {
    KeywordEmbeddings embeddings;
    auto future = embeddings.embed_query_async("cherry cherry cherry");
    auto v = future.get();
    REQUIRE(v.size() == 5);
    REQUIRE(v[2] == Approx(3.0f));
}

TEST_CASE("Embedding provider registry", "[embedding]") {
    EmbeddingsConfig config;
    config.provider = "word2vec";
    REQUIRE_THROWS_AS(make_embeddings(config), std::invalid_argument);

    config.provider = "ollama";
    config.base_url = "";
    REQUIRE_THROWS_AS(make_embeddings(config), std::invalid_argument);

    config.base_url = "http://127.0.0.1:11434/";
    REQUIRE(make_embeddings(config) != nullptr);

    config.provider = "openai";
    config.base_url = "http://127.0.0.1:8000/v1";
    REQUIRE(make_embeddings(config) != nullptr);
}
