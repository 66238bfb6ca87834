#include <functional>
#include <map>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "storage/local_repository.hpp"
#include "storage/object_storage_repository.hpp"
#include "storage/repository.hpp"

namespace workspace_rag {

using RepositoryFactory = std::function<std::shared_ptr<Repository>(const StorageConfig&)>;

namespace {

const std::map<std::string, RepositoryFactory>& repository_factories() {
    static const std::map<std::string, RepositoryFactory> factories = {
        {"local", [](const StorageConfig& c) -> std::shared_ptr<Repository> {
            return std::make_shared<LocalPathRepository>(c.storage_path, c.clear_existing);
        }},
        {"object", [](const StorageConfig& c) -> std::shared_ptr<Repository> {
            auto store = std::make_shared<HttpObjectStore>(c.endpoint, c.bucket, c.access_token);
            return std::make_shared<ObjectStorageRepository>(store, c.prefix);
        }},
        {"memory", [](const StorageConfig& c) -> std::shared_ptr<Repository> {
            return std::make_shared<ObjectStorageRepository>(std::make_shared<MemoryObjectStore>(), c.prefix);
        }},
    };
    return factories;
}

} // namespace

std::shared_ptr<Repository> make_repository(const StorageConfig& config) {
    config.validate();
    const auto& factories = repository_factories();
    auto it = factories.find(config.provider);
    if (it == factories.end()) {
        throw std::invalid_argument("Unsupported storage provider: " + config.provider);
    }
    spdlog::info("📦 Storage backend: {}", config.provider);
    return it->second(config);
}

} // namespace workspace_rag
