#include "workspace_server.hpp"
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "storage/repository.hpp"

namespace workspace_rag {

using json = nlohmann::json;

namespace {

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, status, json{{"error", message}});
}

// Invalid requests -> 400, everything else -> 500.
template <typename Handler>
void guarded(const char* route, httplib::Response& res, Handler&& handler) {
    try {
        handler();
    } catch (const json::exception& e) {
        spdlog::warn("⚠️ {} bad request: {}", route, e.what());
        send_error(res, 400, e.what());
    } catch (const std::invalid_argument& e) {
        spdlog::warn("⚠️ {} bad request: {}", route, e.what());
        send_error(res, 400, e.what());
    } catch (const std::exception& e) {
        spdlog::error("❌ {} failed: {}", route, e.what());
        send_error(res, 500, e.what());
    }
}

json parse_body(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    json body = json::parse(req.body);
    if (!body.is_object()) throw std::invalid_argument("Request body must be a JSON object");
    return body;
}

} // namespace

WorkspaceServer::WorkspaceServer(WorkspaceConfig config,
                                 std::shared_ptr<Embeddings> embeddings,
                                 std::shared_ptr<VectorDB> vector_db,
                                 std::shared_ptr<RerankRunner> reranker)
    : config_(std::move(config)),
      embeddings_(std::move(embeddings)),
      vector_db_(std::move(vector_db)),
      reranker_(std::move(reranker)),
      events_(std::make_shared<WorkspaceEvents>()) {
    setup_routes();
}

std::unique_ptr<WorkspaceServer> WorkspaceServer::from_config(const WorkspaceConfig& config) {
    std::shared_ptr<Embeddings> embeddings;
    std::shared_ptr<VectorDB> vector_db;
    if (config.embedding.enabled) {
        embeddings = make_embeddings(config.embedding);
        vector_db = make_vector_db(config.vector_db, config.embedding.dimensions);
    }
    std::shared_ptr<RerankRunner> reranker;
    if (config.reranker.enabled) reranker = make_reranker(config.reranker);

    return std::make_unique<WorkspaceServer>(config, embeddings, vector_db, reranker);
}

bool WorkspaceServer::listen() {
    spdlog::info("🚀 Starting workspace_rag server on {}:{}", config_.server_host, config_.server_port);
    return server_.listen(config_.server_host, config_.server_port);
}

int WorkspaceServer::bind_to_any_port(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool WorkspaceServer::listen_after_bind() {
    return server_.listen_after_bind();
}

void WorkspaceServer::stop() {
    server_.stop();
}

std::shared_ptr<Workspace> WorkspaceServer::open_workspace(const std::string& workspace_id) {
    std::lock_guard<std::mutex> lock(workspaces_mutex_);
    auto it = workspaces_.find(workspace_id);
    if (it != workspaces_.end()) return it->second;

    auto repository = make_repository(storage_for_workspace(config_.storage, workspace_id));
    auto workspace = std::make_shared<Workspace>(workspace_id, workspace_id, config_, repository,
                                                 embeddings_, vector_db_, reranker_, events_);
    workspaces_[workspace_id] = workspace;
    spdlog::info("📂 Opened workspace {}", workspace_id);
    return workspace;
}

std::shared_ptr<Workspace> WorkspaceServer::find_workspace(const std::string& workspace_id) {
    {
        std::lock_guard<std::mutex> lock(workspaces_mutex_);
        auto it = workspaces_.find(workspace_id);
        if (it != workspaces_.end()) return it->second;
    }
    if (config_.storage.clear_existing) return nullptr;

    auto scoped = storage_for_workspace(config_.storage, workspace_id);
    if (scoped.provider == "local") {
        // Check before constructing the repository, which creates its root.
        auto index_path = std::filesystem::path(scoped.storage_path) / Repository::index_key();
        if (!std::filesystem::is_regular_file(index_path)) return nullptr;
    } else if (!make_repository(scoped)->get_index_data()) {
        return nullptr;
    }
    return open_workspace(workspace_id);
}

void WorkspaceServer::setup_routes() {
    server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });

    server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_.Post("/workspaces/:id/artifacts", [this](const httplib::Request& req, httplib::Response& res) {
        handle_create_artifact(req, res);
    });
    server_.Get("/workspaces/:id/artifacts", [this](const httplib::Request& req, httplib::Response& res) {
        handle_list_artifacts(req, res);
    });
    server_.Get("/workspaces/:id/artifacts/:artifact_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_artifact(req, res);
    });
    server_.Put("/workspaces/:id/artifacts/:artifact_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_update_artifact(req, res);
    });
    server_.Delete("/workspaces/:id/artifacts/:artifact_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete_artifact(req, res);
    });
    server_.Post("/workspaces/:id/retrieve-chunks", [this](const httplib::Request& req, httplib::Response& res) {
        handle_retrieve_chunks(req, res);
    });
    server_.Post("/workspaces/:id/rebuild-index", [this](const httplib::Request& req, httplib::Response& res) {
        handle_rebuild_index(req, res);
    });
    server_.Get("/workspaces/:id/tree", [this](const httplib::Request& req, httplib::Response& res) {
        handle_tree(req, res);
    });
}

void WorkspaceServer::handle_create_artifact(const httplib::Request& req, httplib::Response& res) {
    guarded("create-artifact", res, [&]() {
        auto workspace = open_workspace(req.path_params.at("id"));
        json body = parse_body(req);
        if (!body.contains("artifact_type") || !body["artifact_type"].is_string()) {
            throw std::invalid_argument("artifact_type is required");
        }
        auto type = artifact_type_from_string(body["artifact_type"].get<std::string>());
        auto artifact = workspace->create_artifact(type,
                                                   body.value("artifact_id", ""),
                                                   body.value("content", ""),
                                                   body.value("metadata", json::object()));
        send_json(res, 201, artifact.to_json());
    });
}

void WorkspaceServer::handle_list_artifacts(const httplib::Request& req, httplib::Response& res) {
    guarded("list-artifacts", res, [&]() {
        auto workspace = find_workspace(req.path_params.at("id"));
        if (!workspace) {
            send_error(res, 404, "Workspace not found: " + req.path_params.at("id"));
            return;
        }
        std::vector<ArtifactType> types;
        if (req.has_param("type")) types.push_back(artifact_type_from_string(req.get_param_value("type")));

        json items = json::array();
        for (const auto& a : workspace->list_artifacts(types)) items.push_back(a.to_json());
        send_json(res, 200, json{{"artifacts", items}});
    });
}

void WorkspaceServer::handle_get_artifact(const httplib::Request& req, httplib::Response& res) {
    guarded("get-artifact", res, [&]() {
        auto workspace = find_workspace(req.path_params.at("id"));
        if (!workspace) {
            send_error(res, 404, "Workspace not found: " + req.path_params.at("id"));
            return;
        }
        const auto& artifact_id = req.path_params.at("artifact_id");
        std::string parent_id = req.has_param("parent_id") ? req.get_param_value("parent_id") : "";

        auto artifact = workspace->get_artifact(artifact_id, parent_id);
        if (!artifact) {
            send_error(res, 404, "Artifact not found: " + artifact_id);
            return;
        }
        send_json(res, 200, artifact->to_json(true));
    });
}

void WorkspaceServer::handle_update_artifact(const httplib::Request& req, httplib::Response& res) {
    guarded("update-artifact", res, [&]() {
        auto workspace = find_workspace(req.path_params.at("id"));
        if (!workspace) {
            send_error(res, 404, "Workspace not found: " + req.path_params.at("id"));
            return;
        }
        const auto& artifact_id = req.path_params.at("artifact_id");
        json body = parse_body(req);
        if (!body.contains("content") || !body["content"].is_string()) {
            throw std::invalid_argument("content is required");
        }

        auto artifact = workspace->update_artifact(artifact_id,
                                                   body["content"].get<std::string>(),
                                                   body.value("description", "Content update"));
        if (!artifact) {
            send_error(res, 404, "Artifact not found: " + artifact_id);
            return;
        }
        send_json(res, 200, artifact->to_json());
    });
}

void WorkspaceServer::handle_delete_artifact(const httplib::Request& req, httplib::Response& res) {
    guarded("delete-artifact", res, [&]() {
        auto workspace = find_workspace(req.path_params.at("id"));
        if (!workspace) {
            send_error(res, 404, "Workspace not found: " + req.path_params.at("id"));
            return;
        }
        const auto& artifact_id = req.path_params.at("artifact_id");
        if (!workspace->delete_artifact(artifact_id)) {
            send_error(res, 404, "Artifact not found: " + artifact_id);
            return;
        }
        send_json(res, 200, json{{"artifact_id", artifact_id}, {"status", to_string(ArtifactStatus::ARCHIVED)}});
    });
}

void WorkspaceServer::handle_retrieve_chunks(const httplib::Request& req, httplib::Response& res) {
    guarded("retrieve-chunks", res, [&]() {
        auto workspace = find_workspace(req.path_params.at("id"));
        if (!workspace) {
            send_error(res, 404, "Workspace not found: " + req.path_params.at("id"));
            return;
        }
        auto query = ChunkSearchQuery::from_json(parse_body(req));

        json results = json::array();
        for (const auto& r : workspace->retrieve_chunk(query)) results.push_back(r.to_json());
        send_json(res, 200, json{{"results", results}});
    });
}

void WorkspaceServer::handle_rebuild_index(const httplib::Request& req, httplib::Response& res) {
    guarded("rebuild-index", res, [&]() {
        auto workspace = find_workspace(req.path_params.at("id"));
        if (!workspace) {
            send_error(res, 404, "Workspace not found: " + req.path_params.at("id"));
            return;
        }
        workspace->rebuild_index();
        send_json(res, 200, json{{"status", "ok"}, {"artifacts", workspace->artifact_count()}});
    });
}

void WorkspaceServer::handle_tree(const httplib::Request& req, httplib::Response& res) {
    guarded("tree", res, [&]() {
        auto workspace = find_workspace(req.path_params.at("id"));
        if (!workspace) {
            send_error(res, 404, "Workspace not found: " + req.path_params.at("id"));
            return;
        }
        send_json(res, 200, workspace->generate_tree_data());
    });
}

} // namespace workspace_rag
