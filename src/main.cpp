#include <exception>
#include <string>
#include <spdlog/spdlog.h>

#include "workspace_config.hpp"
#include "workspace_server.hpp"

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path = argc > 1 ? argv[1] : "";

    try {
        auto config = workspace_rag::load_workspace_config(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        auto server = workspace_rag::WorkspaceServer::from_config(config);
        if (!server->listen()) {
            spdlog::error("❌ Could not listen on {}:{}", config.server_host, config.server_port);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::critical("❌ Startup failed: {}", e.what());
        return 1;
    }
    return 0;
}
