#include <catch2/catch.hpp>
#include "chunk/chunker.hpp"
#include "chunk/text_chunkers.hpp"

using namespace workspace_rag;

namespace {

ChunkConfig chunk_config(const std::string& provider, int size, int overlap) {
    ChunkConfig c;
    c.enabled = true;
    c.provider = provider;
    c.chunk_size = size;
    c.chunk_overlap = overlap;
    return c;
}

void require_dense_indices(const std::vector<Chunk>& chunks, const Artifact& artifact) {
    for (size_t i = 0; i < chunks.size(); ++i) {
        CAPTURE(i);
        REQUIRE(chunks[i].chunk_metadata.chunk_index == static_cast<int>(i));
        REQUIRE(chunks[i].chunk_id == artifact.artifact_id() + "_chunk_" + std::to_string(i));
        REQUIRE(chunks[i].artifact_id() == artifact.artifact_id());
        REQUIRE(chunks[i].parent_artifact_id() == artifact.parent_id());
        REQUIRE(chunks[i].chunk_metadata.artifact_type == to_string(artifact.artifact_type()));
    }
}

} // namespace

TEST_CASE("Registry resolves the built-in providers", "[chunk]") {
    auto registry = ChunkerRegistry::with_defaults();
    REQUIRE(registry.has_provider("character"));
    REQUIRE(registry.has_provider("sentence_token"));
    REQUIRE(registry.has_provider("markdown"));
    REQUIRE(registry.has_provider("smart"));
    REQUIRE(registry.providers().size() == 4);

    REQUIRE(make_chunker(chunk_config("smart", 100, 10))->provider() == "smart");
    REQUIRE_THROWS_AS(make_chunker(chunk_config("semantic", 100, 10)), std::invalid_argument);
    REQUIRE_THROWS_AS(make_chunker(chunk_config("character", 10, 20)), std::invalid_argument);
}

TEST_CASE("Character chunker merges pieces up to the chunk size", "[chunk]") {
    Artifact doc(ArtifactType::TEXT, "aaaa\nbbbb\ncccc\ndddd", ArtifactMetadata(), "doc1");

    SECTION("without overlap") {
        CharacterChunker chunker(chunk_config("character", 10, 0));
        auto chunks = chunker.chunk(doc);
        REQUIRE(chunks.size() == 2);
        REQUIRE(chunks[0].content == "aaaa\nbbbb");
        REQUIRE(chunks[1].content == "cccc\ndddd");
        REQUIRE(chunks[0].chunk_metadata.chunk_size == 9);
        require_dense_indices(chunks, doc);
    }
    SECTION("with overlap") {
        CharacterChunker chunker(chunk_config("character", 10, 5));
        auto chunks = chunker.chunk(doc);
        REQUIRE(chunks.size() == 3);
        REQUIRE(chunks[0].content == "aaaa\nbbbb");
        REQUIRE(chunks[1].content == "bbbb\ncccc");
        REQUIRE(chunks[2].content == "cccc\ndddd");
        REQUIRE(chunks[1].chunk_metadata.chunk_overlap == 5);
        require_dense_indices(chunks, doc);
    }
    SECTION("oversized piece becomes its own chunk") {
        Artifact wide(ArtifactType::TEXT, "tiny\nthis piece is far too long\nend", ArtifactMetadata(), "wide");
        CharacterChunker chunker(chunk_config("character", 10, 0));
        auto chunks = chunker.chunk(wide);
        REQUIRE(chunks.size() == 3);
        REQUIRE(chunks[1].content == "this piece is far too long");
    }
}

TEST_CASE("Chunkers return nothing for empty content", "[chunk]") {
    Artifact empty(ArtifactType::TEXT, "", ArtifactMetadata(), "empty");
    for (const std::string provider : {"character", "sentence_token", "markdown", "smart"}) {
        CAPTURE(provider);
        REQUIRE(make_chunker(chunk_config(provider, 100, 10))->chunk(empty).empty());
    }
}

TEST_CASE("Chunking is deterministic", "[chunk]") {
    Artifact doc(ArtifactType::TEXT,
                 "First sentence here. Second one follows!\n\n# Header\nA list:\n- item one\n- item two\nClosing words.",
                 ArtifactMetadata(), "doc1");
    for (const std::string provider : {"character", "sentence_token", "markdown", "smart"}) {
        CAPTURE(provider);
        auto chunker = make_chunker(chunk_config(provider, 30, 5));
        auto first = chunker->chunk(doc);
        auto second = chunker->chunk(doc);
        REQUIRE_FALSE(first.empty());
        REQUIRE(first.size() == second.size());
        for (size_t i = 0; i < first.size(); ++i) REQUIRE(first[i].content == second[i].content);
        require_dense_indices(first, doc);
    }
}

TEST_CASE("Sentence chunker packs whole sentences with token overlap", "[chunk]") {
    ChunkConfig c = chunk_config("sentence_token", 100, 1);
    c.tokens_per_chunk = 4;
    SentenceTokenChunker chunker(c);

    auto pieces = chunker.split_text("One two three. Four five six. Seven eight.");
    REQUIRE(pieces.size() == 3);
    REQUIRE(pieces[0] == "One two three.");
    REQUIRE(pieces[1] == "three. Four five six.");
    REQUIRE(pieces[2] == "six. Seven eight.");

    ChunkConfig bad = chunk_config("sentence_token", 100, 4);
    bad.tokens_per_chunk = 4;
    REQUIRE_THROWS_AS(SentenceTokenChunker(bad), std::invalid_argument);
}

TEST_CASE("Markdown chunker splits on headers and ignores fenced code", "[chunk]") {
    const std::string text =
        "# Title\nIntro text\n"
        "## Part A\nAlpha body\n"
        "### Detail\nDeep\n"
        "## Part B\nBeta body\n```\n# not a header\n```\n";
    Artifact doc(ArtifactType::MARKDOWN, text, ArtifactMetadata(), "md");
    MarkdownChunker chunker(chunk_config("markdown", 100, 10));

    auto sections = chunker.split_sections(text);
    REQUIRE(sections.size() == 4);
    REQUIRE(sections[0].header_1 == "Title");
    REQUIRE(sections[0].content == "Intro text");
    REQUIRE(sections[1].header_2 == "Part A");
    REQUIRE(sections[2].header_3 == "Detail");
    REQUIRE(sections[3].header_2 == "Part B");
    REQUIRE(sections[3].header_3.empty());
    REQUIRE(sections[3].content == "Beta body\n```\n# not a header\n```");

    auto chunks = chunker.chunk(doc);
    REQUIRE(chunks.size() == 4);
    REQUIRE(chunks[1].content == "Header#1 Title\nHeader#2: Part A\nHeader#3: \nContent: \n\n  Alpha body");
    REQUIRE(chunks[1].chunk_metadata.chunk_size == 10);
    REQUIRE(chunks[1].chunk_metadata.chunk_overlap == 0);
    require_dense_indices(chunks, doc);
}

TEST_CASE("Smart chunker prefers line boundaries and overlaps whole lines", "[chunk]") {
    std::string text;
    for (int i = 1; i <= 6; ++i) text += "Sentence number " + std::to_string(i) + ".\n";
    Artifact doc(ArtifactType::TEXT, text, ArtifactMetadata(), "smart");

    SECTION("no overlap") {
        SmartChunker chunker(chunk_config("smart", 50, 0));
        auto chunks = chunker.chunk(doc);
        REQUIRE(chunks.size() == 3);
        REQUIRE(chunks[0].content == "Sentence number 1.\nSentence number 2.");
        REQUIRE(chunks[2].content == "Sentence number 5.\nSentence number 6.");
    }
    SECTION("overlap carries the last line forward") {
        SmartChunker chunker(chunk_config("smart", 50, 20));
        auto chunks = chunker.chunk(doc);
        REQUIRE(chunks.size() == 5);
        for (size_t i = 1; i < chunks.size(); ++i) {
            const auto& prev = chunks[i - 1].content;
            std::string last_line = prev.substr(prev.rfind('\n') + 1);
            REQUIRE(chunks[i].content.rfind(last_line, 0) == 0);
        }
    }
}

TEST_CASE("Smart chunker text hygiene", "[chunk]") {
    REQUIRE(SmartChunker::is_good_split_point("Ends with a period."));
    REQUIRE(SmartChunker::is_good_split_point("## Heading"));
    REQUIRE(SmartChunker::is_good_split_point("- list item"));
    REQUIRE(SmartChunker::is_good_split_point("   "));
    REQUIRE_FALSE(SmartChunker::is_good_split_point("- trailing comma,"));
    REQUIRE_FALSE(SmartChunker::is_good_split_point("mid sentence"));

    REQUIRE(SmartChunker::clean_content("\n\nfirst   \n\n\n\nsecond\n\n") == "first\n\nsecond");
    REQUIRE(SmartChunker::clean_chunk("a\n\n\nb") == "a\n\nb");
}
