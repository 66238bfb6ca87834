#include "storage/repository.hpp"
#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace workspace_rag {

using json = nlohmann::json;

// --- key grammar ---

std::string Repository::index_history_key(int64_t unix_seconds) {
    return "versions/index_his_" + std::to_string(unix_seconds) + ".json";
}

std::string Repository::artifact_dir(const std::string& artifact_id) {
    validate_storage_id(artifact_id, "artifact id");
    return "artifacts/" + artifact_id;
}

std::string Repository::artifact_index_key(const std::string& artifact_id) {
    return artifact_dir(artifact_id) + "/index.json";
}

std::string Repository::sub_dir(const std::string& artifact_id, const std::string& sub_id) {
    validate_storage_id(sub_id, "sub-artifact id");
    return artifact_dir(artifact_id) + "/sublist/" + sub_id;
}

std::string Repository::sub_data_key(const std::string& artifact_id, const std::string& sub_id,
                                     const std::string& ext) {
    return sub_dir(artifact_id, sub_id) + "/origin." + ext;
}

std::string Repository::chunk_dir(const std::string& artifact_id, const std::string& parent_id) {
    if (parent_id.empty()) return artifact_dir(artifact_id) + "/chunks";
    return sub_dir(parent_id, artifact_id) + "/chunks";
}

std::string Repository::chunk_key(const std::string& artifact_id, const std::string& parent_id, int chunk_index) {
    return chunk_dir(artifact_id, parent_id) + "/" + Chunk::chunk_file_name_at(artifact_id, chunk_index);
}

std::string Repository::attachment_key(const std::string& artifact_id, const std::string& file_name) {
    validate_storage_id(file_name, "attachment file name");
    return artifact_dir(artifact_id) + "/attachment_files/" + file_name;
}

// --- shared helpers ---

std::optional<json> Repository::read_json(const std::string& key) {
    auto raw = read_object(key);
    if (!raw) return std::nullopt;
    try {
        return json::parse(*raw);
    } catch (const json::parse_error& e) {
        spdlog::error("❌ [{}] Corrupt JSON at {}: {}", backend_name(), key, e.what());
        throw std::runtime_error("Corrupt JSON object at " + key + ": " + e.what());
    }
}

std::optional<Chunk> Repository::read_chunk(const std::string& key) {
    auto j = read_json(key);
    if (!j) return std::nullopt;
    try {
        return Chunk::from_json(*j);
    } catch (const json::exception& e) {
        spdlog::error("❌ [{}] Invalid chunk record at {}: {}", backend_name(), key, e.what());
        throw std::runtime_error("Invalid chunk record at " + key + ": " + e.what());
    }
}

// --- workspace index ---

std::optional<json> Repository::get_index_data() {
    return read_json(index_key());
}

void Repository::store_index(const json& data) {
    json index = read_json(index_key()).value_or(json::object());
    index["workspace"] = data;

    if (object_exists(index_key())) {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        move_object(index_key(), index_history_key(now));
    }
    write_object(index_key(), index.dump(2));
    spdlog::info("💾 [{}] Workspace index stored", backend_name());
}

// --- artifacts ---

void Repository::store_artifact(const Artifact& artifact, bool save_sub_list_content, bool save_attachment_files) {
    json descriptor = artifact.to_json(true);
    const auto& id = artifact.artifact_id();

    if (save_sub_list_content) {
        const auto& subs = artifact.sublist();
        for (size_t i = 0; i < subs.size(); ++i) {
            if (subs[i].content().empty()) continue;
            write_object(sub_data_key(id, subs[i].artifact_id()), subs[i].content());
            descriptor["sublist"][i]["content"] = "";
        }
    }

    if (save_attachment_files) {
        for (const auto& file : artifact.attachment_files()) {
            std::ifstream in(file.file_path, std::ios::binary);
            if (!in) {
                spdlog::error("❌ [{}] Attachment {} of {} is not readable at {}",
                              backend_name(), file.file_name, id, file.file_path);
                throw std::runtime_error("Attachment not readable: " + file.file_path);
            }
            std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            write_object(attachment_key(id, file.file_name), bytes);
        }
    }

    write_object(artifact_index_key(id), descriptor.dump(2));
    spdlog::info("💾 [{}] Stored artifact {} ({} sub-artifacts)", backend_name(), id, artifact.sublist().size());
}

std::optional<json> Repository::retrieve_artifact(const std::string& artifact_id) {
    auto j = read_json(artifact_index_key(artifact_id));
    if (!j) spdlog::debug("🔍 [{}] Artifact {} not found", backend_name(), artifact_id);
    return j;
}

std::optional<std::string> Repository::get_subartifact_content(const std::string& artifact_id,
                                                                const std::string& parent_id) {
    return read_object(sub_data_key(parent_id, artifact_id));
}

std::optional<std::string> Repository::get_attachment_file(const std::string& artifact_id,
                                                           const std::string& file_name) {
    return read_object(attachment_key(artifact_id, file_name));
}

// --- chunks ---

ChunkWindow Repository::get_chunk_window(const std::string& artifact_id,
                                         const std::string& parent_id,
                                         int chunk_index,
                                         int pre_n,
                                         int next_n) {
    ChunkWindow window;
    if (chunk_index < 0) return window;

    window.target = read_chunk(chunk_key(artifact_id, parent_id, chunk_index));
    if (!window.target) {
        spdlog::warn("⚠️ [{}] Chunk {} of {} not found", backend_name(), chunk_index, artifact_id);
        return window;
    }

    // Both directions stop at the first gap.
    for (int i = 1; i <= pre_n && chunk_index - i >= 0; ++i) {
        auto chunk = read_chunk(chunk_key(artifact_id, parent_id, chunk_index - i));
        if (!chunk) break;
        window.pre_n_chunks.push_back(std::move(*chunk));
    }
    for (int i = 1; i <= next_n; ++i) {
        auto chunk = read_chunk(chunk_key(artifact_id, parent_id, chunk_index + i));
        if (!chunk) break;
        window.next_n_chunks.push_back(std::move(*chunk));
    }
    return window;
}

std::optional<std::vector<Chunk>> Repository::get_chunks(const std::string& artifact_id,
                                                         const std::string& parent_id) {
    auto keys = list_dir(chunk_dir(artifact_id, parent_id));
    if (!keys) return std::nullopt;

    std::vector<Chunk> chunks;
    for (const auto& key : *keys) {
        if (key.size() < 5 || key.compare(key.size() - 5, 5, ".json") != 0) continue;
        try {
            if (auto chunk = read_chunk(key)) chunks.push_back(std::move(*chunk));
        } catch (const std::runtime_error& e) {
            spdlog::error("❌ [{}] Skipping unreadable chunk {}: {}", backend_name(), key, e.what());
        }
    }
    return chunks;
}

} // namespace workspace_rag
