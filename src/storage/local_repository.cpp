#include "storage/local_repository.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace workspace_rag {

namespace fs = std::filesystem;

namespace {

// Owns a temporary directory until commit(); removes it otherwise.
class StagingDirectory {
public:
    explicit StagingDirectory(fs::path path) : path_(std::move(path)) {
        fs::create_directories(path_);
    }
    ~StagingDirectory() {
        if (committed_) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) spdlog::warn("⚠️ Could not remove staging dir {}: {}", path_.string(), ec.message());
    }
    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    const fs::path& path() const { return path_; }
    void commit() { committed_ = true; }

private:
    fs::path path_;
    bool committed_ = false;
};

void write_file(const fs::path& path, const std::string& data) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot open for writing: " + path.string());
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("Write failed: " + path.string());
}

} // namespace

LocalPathRepository::LocalPathRepository(const std::string& storage_path, bool clear_existing)
    : root_(storage_path) {
    if (storage_path.empty()) {
        throw std::invalid_argument("LocalPathRepository requires a storage path");
    }
    if (clear_existing && fs::exists(root_)) {
        spdlog::warn("🧹 Clearing existing repository at {}", root_.string());
        fs::remove_all(root_);
    }
    fs::create_directories(root_);
    spdlog::info("📦 Local repository ready at {}", root_.string());
}

fs::path LocalPathRepository::full_path(const std::string& key) const {
    return root_ / fs::path(key);
}

std::optional<std::string> LocalPathRepository::read_object(const std::string& key) {
    auto path = full_path(key);
    if (!fs::is_regular_file(path)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("❌ [local] Cannot open {}", path.string());
        throw std::runtime_error("Cannot open for reading: " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void LocalPathRepository::write_object(const std::string& key, const std::string& data) {
    try {
        write_file(full_path(key), data);
    } catch (const fs::filesystem_error& e) {
        spdlog::error("❌ [local] Write of {} failed: {}", key, e.what());
        throw std::runtime_error(std::string("Local write failed: ") + e.what());
    }
}

bool LocalPathRepository::object_exists(const std::string& key) {
    return fs::exists(full_path(key));
}

void LocalPathRepository::move_object(const std::string& from, const std::string& to) {
    auto source = full_path(from);
    if (!fs::exists(source)) {
        spdlog::debug("🔍 [local] Move source {} is gone, nothing to move", from);
        return;
    }
    try {
        auto target = full_path(to);
        fs::create_directories(target.parent_path());
        fs::rename(source, target);
    } catch (const fs::filesystem_error& e) {
        spdlog::error("❌ [local] Move {} -> {} failed: {}", from, to, e.what());
        throw std::runtime_error(std::string("Local move failed: ") + e.what());
    }
}

std::optional<std::vector<std::string>> LocalPathRepository::list_dir(const std::string& dir) {
    auto path = full_path(dir);
    if (!fs::is_directory(path)) return std::nullopt;

    std::vector<std::string> keys;
    for (const auto& entry : fs::directory_iterator(path)) {
        if (entry.is_regular_file()) {
            keys.push_back(dir + "/" + entry.path().filename().string());
        }
    }
    return keys;
}

void LocalPathRepository::store_artifact_chunks(const Artifact& artifact, const std::vector<Chunk>& chunks) {
    const auto& id = artifact.artifact_id();
    fs::path chunk_path = full_path(chunk_dir(id, artifact.parent_id()));
    fs::path parent = chunk_path.parent_path();

    try {
        fs::create_directories(parent);
        StagingDirectory staging(parent / ("chunks.tmp-" + generate_uuid()));

        for (const auto& chunk : chunks) {
            write_file(staging.path() / chunk.chunk_file_name(), chunk.to_json().dump(2));
        }

        fs::path retired;
        if (fs::exists(chunk_path)) {
            retired = parent / ("chunks.old-" + generate_uuid());
            fs::rename(chunk_path, retired);
        }

        try {
            fs::rename(staging.path(), chunk_path);
            staging.commit();
        } catch (const fs::filesystem_error&) {
            if (!retired.empty()) {
                std::error_code ec;
                fs::rename(retired, chunk_path, ec);
            }
            throw;
        }

        if (!retired.empty()) fs::remove_all(retired);
    } catch (const fs::filesystem_error& e) {
        spdlog::error("❌ [local] Chunk rewrite for {} failed: {}", id, e.what());
        throw std::runtime_error(std::string("Chunk rewrite failed: ") + e.what());
    }

    spdlog::info("✅ [local] Stored {} chunks for {}", chunks.size(), id);
}

} // namespace workspace_rag
