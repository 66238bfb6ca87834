#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <httplib.h>
#include "embedding/embedding_service.hpp"
#include "rerank/reranker.hpp"
#include "vector/vector_store.hpp"
#include "workspace.hpp"
#include "workspace_config.hpp"
#include "workspace_events.hpp"

namespace workspace_rag {

// HTTP front of the workspaces. Workspaces are opened on first use and share
// the embedding client, vector store and reranker.
class WorkspaceServer {
public:
    WorkspaceServer(WorkspaceConfig config,
                    std::shared_ptr<Embeddings> embeddings,
                    std::shared_ptr<VectorDB> vector_db,
                    std::shared_ptr<RerankRunner> reranker);

    // Builds every collaborator the configuration enables.
    static std::unique_ptr<WorkspaceServer> from_config(const WorkspaceConfig& config);

    bool listen();
    int bind_to_any_port(const std::string& host = "127.0.0.1");
    bool listen_after_bind();
    void stop();
    bool is_running() const { return server_.is_running(); }

    // Opens (and creates on first write) the workspace.
    std::shared_ptr<Workspace> open_workspace(const std::string& workspace_id);
    // Cached or already persisted workspaces only; nullptr otherwise.
    std::shared_ptr<Workspace> find_workspace(const std::string& workspace_id);
    WorkspaceEvents& events() { return *events_; }

private:
    void setup_routes();

    void handle_create_artifact(const httplib::Request& req, httplib::Response& res);
    void handle_list_artifacts(const httplib::Request& req, httplib::Response& res);
    void handle_get_artifact(const httplib::Request& req, httplib::Response& res);
    void handle_update_artifact(const httplib::Request& req, httplib::Response& res);
    void handle_delete_artifact(const httplib::Request& req, httplib::Response& res);
    void handle_retrieve_chunks(const httplib::Request& req, httplib::Response& res);
    void handle_rebuild_index(const httplib::Request& req, httplib::Response& res);
    void handle_tree(const httplib::Request& req, httplib::Response& res);

    WorkspaceConfig config_;
    httplib::Server server_;

    std::shared_ptr<Embeddings> embeddings_;
    std::shared_ptr<VectorDB> vector_db_;
    std::shared_ptr<RerankRunner> reranker_;
    std::shared_ptr<WorkspaceEvents> events_;

    std::unordered_map<std::string, std::shared_ptr<Workspace>> workspaces_;
    std::mutex workspaces_mutex_;
};

} // namespace workspace_rag
