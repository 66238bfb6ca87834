#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "artifact.hpp"

namespace workspace_rag {

// Per-workspace artifact lifecycle callbacks. Callbacks run synchronously on
// the thread that completed the operation; one that throws is logged and the
// remaining callbacks still run.
class WorkspaceEvents {
public:
    using Callback = std::function<void(const std::string& workspace_id, const Artifact& artifact)>;

    void on_create(Callback cb) { add(create_, std::move(cb)); }
    void on_update(Callback cb) { add(update_, std::move(cb)); }
    void on_delete(Callback cb) { add(delete_, std::move(cb)); }

    void emit_create(const std::string& workspace_id, const Artifact& a) { emit("create", create_, workspace_id, a); }
    void emit_update(const std::string& workspace_id, const Artifact& a) { emit("update", update_, workspace_id, a); }
    void emit_delete(const std::string& workspace_id, const Artifact& a) { emit("delete", delete_, workspace_id, a); }

private:
    void add(std::vector<Callback>& list, Callback cb) {
        std::lock_guard<std::mutex> lock(mutex_);
        list.push_back(std::move(cb));
    }

    void emit(const char* event, const std::vector<Callback>& list,
              const std::string& workspace_id, const Artifact& artifact) {
        std::vector<Callback> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = list;
        }
        for (const auto& cb : snapshot) {
            try {
                cb(workspace_id, artifact);
            } catch (const std::exception& e) {
                spdlog::error("❌ {} callback failed for artifact {}: {}", event, artifact.artifact_id(), e.what());
            }
        }
    }

    std::mutex mutex_;
    std::vector<Callback> create_;
    std::vector<Callback> update_;
    std::vector<Callback> delete_;
};

} // namespace workspace_rag
