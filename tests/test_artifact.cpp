#include <catch2/catch.hpp>
#include "artifact.hpp"

using namespace workspace_rag;
using json = nlohmann::json;

TEST_CASE("Artifact type names round-trip", "[artifact]") {
    REQUIRE(to_string(ArtifactType::WEB_PAGES) == "WEB_PAGES");
    REQUIRE(artifact_type_from_string("NOVEL") == ArtifactType::NOVEL);
    REQUIRE_THROWS_AS(artifact_type_from_string("PDF_SCAN"), std::invalid_argument);
    REQUIRE_THROWS_AS(artifact_status_from_string("deleted"), std::invalid_argument);
}

TEST_CASE("New artifact gets an id and an initial version", "[artifact]") {
    Artifact a(ArtifactType::TEXT, "hello");
    REQUIRE_FALSE(a.artifact_id().empty());
    REQUIRE(a.status() == ArtifactStatus::DRAFT);
    REQUIRE(a.version_history().size() == 1);
    REQUIRE(a.version_history()[0].description == "Initial version");
    REQUIRE(a.version_history()[0].content == "hello");

    Artifact b(ArtifactType::TEXT, "hello");
    REQUIRE(a.artifact_id() != b.artifact_id());

    Artifact named(ArtifactType::CODE, "int x;", ArtifactMetadata(), "doc1");
    REQUIRE(named.artifact_id() == "doc1");
}

TEST_CASE("Lifecycle transitions grow the version history", "[artifact]") {
    Artifact a(ArtifactType::MARKDOWN, "v1", ArtifactMetadata(), "doc1");

    a.update_content("v2", "second draft");
    REQUIRE(a.status() == ArtifactStatus::EDITED);
    REQUIRE(a.content() == "v2");
    REQUIRE(a.version_history().size() == 2);
    REQUIRE(a.version_history().back().description == "second draft");

    a.mark_complete();
    REQUIRE(a.status() == ArtifactStatus::COMPLETE);
    REQUIRE(a.version_history().size() == 3);

    a.archive();
    REQUIRE(a.status() == ArtifactStatus::ARCHIVED);
    REQUIRE(a.version_history().size() == 4);
}

TEST_CASE("Revert restores content and records the revert", "[artifact]") {
    Artifact a(ArtifactType::TEXT, "first", ArtifactMetadata(), "doc1");
    a.update_content("second");

    REQUIRE(a.revert_to_version(0));
    REQUIRE(a.content() == "first");
    REQUIRE(a.status() == ArtifactStatus::DRAFT);
    REQUIRE(a.version_history().size() == 3);
    REQUIRE(a.version_history().back().description == "Reverted to version 0");

    REQUIRE_FALSE(a.revert_to_version(42));
    REQUIRE(a.version_history().size() == 3);
    REQUIRE_FALSE(a.get_version(42).has_value());
    REQUIRE(a.get_version(1)->content == "second");
}

TEST_CASE("Metadata accessors report absence explicitly", "[artifact]") {
    ArtifactMetadata meta(json{{"filename", "notes.md"}, {"pages", 12}});
    REQUIRE(meta.get_string("filename") == std::optional<std::string>("notes.md"));
    REQUIRE(meta.get_int("pages") == std::optional<int64_t>(12));
    REQUIRE_FALSE(meta.get_string("pages").has_value());
    REQUIRE_FALSE(meta.get_string("author").has_value());
    REQUIRE_THROWS_AS(meta.require_string("author"), std::out_of_range);
    REQUIRE_THROWS_AS(ArtifactMetadata(json::array()), std::invalid_argument);

    meta.merge(json{{"author", "kim"}});
    REQUIRE(meta.require_string("author") == "kim");
    REQUIRE_THROWS_AS(meta.merge(json("x")), std::invalid_argument);
}

TEST_CASE("Sub-artifacts carry their parent id", "[artifact]") {
    Artifact parent(ArtifactType::NOVEL, "", ArtifactMetadata(), "book");
    parent.add_subartifact(Artifact(ArtifactType::TEXT, "chapter one", ArtifactMetadata(), "ch1"));
    parent.add_subartifact(Artifact(ArtifactType::TEXT, "chapter two", ArtifactMetadata(), "ch2", "someone-else"));

    REQUIRE(parent.sublist().size() == 2);
    REQUIRE(parent.sublist()[0].parent_id() == "book");
    REQUIRE(parent.sublist()[1].parent_id() == "book");
    REQUIRE(parent.find_subartifact("ch2")->content() == "chapter two");
    REQUIRE(parent.find_subartifact("ch3") == nullptr);
}

TEST_CASE("Artifact JSON round-trip keeps the tree", "[artifact]") {
    Artifact parent(ArtifactType::NOVEL, "preface", ArtifactMetadata(json{{"filename", "book.txt"}}), "book");
    parent.add_subartifact(Artifact(ArtifactType::TEXT, "chapter one", ArtifactMetadata(), "ch1"));
    parent.update_content("preface v2");
    parent.attachment_files().push_back({"cover.png", "cover image", "/tmp/cover.png"});

    json j = parent.to_json(true);
    REQUIRE(j["artifact_type"] == "NOVEL");
    REQUIRE(j["version_history"].size() == 2);
    REQUIRE_FALSE(j.contains("chunk_list"));

    auto restored = Artifact::from_json(j);
    REQUIRE(restored.has_value());
    REQUIRE(restored->artifact_id() == "book");
    REQUIRE(restored->content() == "preface v2");
    REQUIRE(restored->status() == ArtifactStatus::EDITED);
    REQUIRE(restored->version_history().size() == 2);
    REQUIRE(restored->metadata().get_string("filename") == std::optional<std::string>("book.txt"));
    REQUIRE(restored->attachment_files().size() == 1);
    REQUIRE(restored->attachment_files()[0].file_name == "cover.png");
    REQUIRE(restored->sublist().size() == 1);
    REQUIRE(restored->sublist()[0].parent_id() == "book");
    REQUIRE(restored->sublist()[0].content() == "chapter one");
}

TEST_CASE("Artifact descriptor without an id is rejected", "[artifact]") {
    REQUIRE_FALSE(Artifact::from_json(json{{"artifact_type", "TEXT"}}).has_value());
    REQUIRE_FALSE(Artifact::from_json(json::array()).has_value());
    REQUIRE(Artifact::from_json(json{{"artifact_id", "x"}, {"parent_id", nullptr}})->parent_id().empty());
}

TEST_CASE("Artifact ids must be single path segments", "[artifact]") {
    const std::vector<std::string> bad_ids = {"..", ".", "../escape", "a/b", "a\\b", std::string("a\0b", 3)};
    for (const auto& bad : bad_ids) {
        REQUIRE_THROWS_AS(Artifact(ArtifactType::TEXT, "x", ArtifactMetadata(), bad), std::invalid_argument);
    }
    REQUIRE_THROWS_AS(Artifact(ArtifactType::TEXT, "x", ArtifactMetadata(), "ok", "../parent"), std::invalid_argument);
    REQUIRE_THROWS_AS(Artifact::from_json(json{{"artifact_id", "../../escape"}}), std::invalid_argument);
    REQUIRE_NOTHROW(Artifact(ArtifactType::TEXT, "x", ArtifactMetadata(), "chapter-1.v2 final"));
}

TEST_CASE("Chunk record names and JSON", "[artifact]") {
    Chunk c;
    c.chunk_id = "doc1_chunk_2";
    c.content = "text";
    c.chunk_metadata.chunk_index = 2;
    c.chunk_metadata.artifact_id = "doc1";
    c.chunk_metadata.artifact_type = "TEXT";

    REQUIRE(c.chunk_file_name() == "doc1_chunk_2.json");
    auto back = Chunk::from_json(c.to_json());
    REQUIRE(back.chunk_id == "doc1_chunk_2");
    REQUIRE(back.chunk_metadata.chunk_index == 2);
    REQUIRE(back.artifact_id() == "doc1");
    REQUIRE(back.parent_artifact_id().empty());
}

TEST_CASE("Chunk search query validation", "[artifact][query]") {
    ChunkSearchQuery q;
    q.query = "what happened";
    REQUIRE_NOTHROW(q.validate());

    SECTION("blank query") {
        q.query = "   ";
        REQUIRE_THROWS_AS(q.validate(), std::invalid_argument);
    }
    SECTION("non-positive limit") {
        q.limit = 0;
        REQUIRE_THROWS_AS(q.validate(), std::invalid_argument);
    }
    SECTION("negative window") {
        q.pre_n = -1;
        REQUIRE_THROWS_AS(q.validate(), std::invalid_argument);
    }
    SECTION("threshold out of range") {
        q.threshold = 1.5;
        REQUIRE_THROWS_AS(q.validate(), std::invalid_argument);
    }
    SECTION("from_json requires the query text") {
        REQUIRE_THROWS_AS(ChunkSearchQuery::from_json(json{{"limit", 3}}), std::invalid_argument);
        auto parsed = ChunkSearchQuery::from_json(json{{"query", "q"}, {"limit", 3}, {"pre_n", 1}});
        REQUIRE(parsed.limit == 3);
        REQUIRE(parsed.pre_n == 1);
        REQUIRE(parsed.next_n == 3);
        REQUIRE(parsed.threshold == Approx(0.8));
    }
}
