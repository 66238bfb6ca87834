#pragma once

#include <filesystem>
#include <string>
#include "storage/repository.hpp"

namespace workspace_rag {

class LocalPathRepository : public Repository {
public:
    explicit LocalPathRepository(const std::string& storage_path, bool clear_existing = false);

    // Writes the new set into a sibling staging directory, then swaps it in
    // with renames. Staging is removed on every failure path.
    void store_artifact_chunks(const Artifact& artifact, const std::vector<Chunk>& chunks) override;

    std::string backend_name() const override { return "local"; }
    const std::filesystem::path& root() const { return root_; }

protected:
    std::optional<std::string> read_object(const std::string& key) override;
    void write_object(const std::string& key, const std::string& data) override;
    bool object_exists(const std::string& key) override;
    void move_object(const std::string& from, const std::string& to) override;
    std::optional<std::vector<std::string>> list_dir(const std::string& dir) override;

private:
    std::filesystem::path full_path(const std::string& key) const;

    std::filesystem::path root_;
};

} // namespace workspace_rag
