#include <catch2/catch.hpp>
#include <algorithm>
#include <set>
#include "repository_contract.hpp"
#include "storage/local_repository.hpp"
#include "storage/object_storage_repository.hpp"
#include "test_helpers.hpp"

using namespace workspace_rag;
using namespace workspace_rag::testing;
namespace fs = std::filesystem;

TEST_CASE("Object storage repository honors the repository contract", "[storage][object]") {
    auto store = std::make_shared<MemoryObjectStore>();
    ObjectStorageRepository repo(store, "tenant-a");
    check_repository_contract(repo);
}

TEST_CASE("Object keys are namespaced by the prefix", "[storage][object]") {
    auto store = std::make_shared<MemoryObjectStore>();
    ObjectStorageRepository repo(store, "tenant-a/");
    Artifact doc(ArtifactType::TEXT, "body", ArtifactMetadata(), "doc1");

    repo.store_artifact(doc);
    repo.store_artifact_chunks(doc, numbered_chunks(doc, 2));

    auto keys = store->list("");
    REQUIRE(keys.size() == 3);
    for (const auto& key : keys) REQUIRE(key.rfind("tenant-a/artifacts/doc1/", 0) == 0);
}

TEST_CASE("Object re-chunking prunes out-of-range chunk objects", "[storage][object]") {
    auto store = std::make_shared<MemoryObjectStore>();
    ObjectStorageRepository repo(store);
    Artifact doc(ArtifactType::TEXT, "body", ArtifactMetadata(), "doc1");

    repo.store_artifact_chunks(doc, numbered_chunks(doc, 6));
    repo.store_artifact_chunks(doc, numbered_chunks(doc, 2, "v2 "));

    auto keys = store->list("artifacts/doc1/chunks/");
    std::sort(keys.begin(), keys.end());
    REQUIRE(keys == std::vector<std::string>{
        "artifacts/doc1/chunks/doc1_chunk_0.json",
        "artifacts/doc1/chunks/doc1_chunk_1.json"});
}

TEST_CASE("Index history moves the old object", "[storage][object]") {
    auto store = std::make_shared<MemoryObjectStore>();
    ObjectStorageRepository repo(store);

    repo.store_index(nlohmann::json{{"name", "v1"}});
    repo.store_index(nlohmann::json{{"name", "v2"}});

    auto history = store->list("versions/");
    REQUIRE(history.size() == 1);
    auto archived = nlohmann::json::parse(*store->get(history[0]));
    REQUIRE(archived["workspace"]["name"] == "v1");
}

TEST_CASE("Local and object backends produce the same keys", "[storage]") {
    TempDir dir;
    TempDir source;
    write_file(source.path() / "notes.txt", "attached");

    LocalPathRepository local(dir.str());
    auto store = std::make_shared<MemoryObjectStore>();
    ObjectStorageRepository object(store);

    Artifact parent(ArtifactType::NOVEL, "preface", ArtifactMetadata(), "book");
    auto& chapter = parent.add_subartifact(Artifact(ArtifactType::TEXT, "chapter", ArtifactMetadata(), "ch1"));
    Artifact chapter_copy = chapter;
    parent.attachment_files().push_back({"notes.txt", "", (source.path() / "notes.txt").string()});

    for (Repository* repo : std::vector<Repository*>{&local, &object}) {
        repo->store_artifact(parent);
        repo->store_artifact_chunks(parent, numbered_chunks(parent, 2));
        repo->store_artifact_chunks(chapter_copy, numbered_chunks(chapter_copy, 2));
    }

    std::set<std::string> local_keys;
    for (const auto& entry : fs::recursive_directory_iterator(dir.path())) {
        if (entry.is_regular_file()) local_keys.insert(fs::relative(entry.path(), dir.path()).generic_string());
    }
    auto object_list = store->list("");
    std::set<std::string> object_keys(object_list.begin(), object_list.end());

    REQUIRE(local_keys == object_keys);
    REQUIRE(object_keys.count("artifacts/book/sublist/ch1/chunks/ch1_chunk_1.json") == 1);
    REQUIRE(object_keys.count("artifacts/book/attachment_files/notes.txt") == 1);
}

TEST_CASE("Memory object store listing is prefix based", "[storage][object]") {
    MemoryObjectStore store;
    store.put("a/1", "x");
    store.put("a/2/deep", "y");
    store.put("b/1", "z");

    REQUIRE(store.list("a/").size() == 2);
    REQUIRE(store.exists("b/1"));
    store.remove("b/1");
    REQUIRE_FALSE(store.exists("b/1"));
    REQUIRE_FALSE(store.get("b/1").has_value());
    REQUIRE(store.size() == 2);
}
