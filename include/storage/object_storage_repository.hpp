#pragma once

#include <memory>
#include <string>
#include "storage/object_store.hpp"
#include "storage/repository.hpp"

namespace workspace_rag {

class ObjectStorageRepository : public Repository {
public:
    ObjectStorageRepository(std::shared_ptr<ObjectStore> store, std::string prefix = "");

    // Overwrites chunk objects in place, then deletes objects outside the new
    // index range. Every in-range key always holds a complete chunk record.
    void store_artifact_chunks(const Artifact& artifact, const std::vector<Chunk>& chunks) override;

    std::string backend_name() const override { return "object"; }

protected:
    std::optional<std::string> read_object(const std::string& key) override;
    void write_object(const std::string& key, const std::string& data) override;
    bool object_exists(const std::string& key) override;
    void move_object(const std::string& from, const std::string& to) override;
    std::optional<std::vector<std::string>> list_dir(const std::string& dir) override;

private:
    std::string full_key(const std::string& key) const;
    std::string relative_key(const std::string& key) const;

    std::shared_ptr<ObjectStore> store_;
    std::string prefix_;
};

} // namespace workspace_rag
