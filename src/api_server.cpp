#include "api_server.hpp"

namespace toolhost {

APIServer::APIServer(McpServer& mcp_server, std::chrono::milliseconds heartbeat_interval, size_t max_stream_bytes)
    : mcpServer(mcp_server), sessionManager(std::make_shared<MCPSessionManager>())
{
    mcpRouteHandlers = std::make_unique<MCPRouteHandlers>(
        mcpServer.dispatcher(), sessionManager, mcpServer.registry(), mcpServer.metrics(),
        max_stream_bytes);

    setupRoutes();
    setupCORS();
    setupHeartbeat(heartbeat_interval);

    CROW_LOG_INFO << "APIServer initialized";
}

APIServer::~APIServer() {
    heartbeatWorker->stop();
    sessionManager->closeAll();
}

void APIServer::setupRoutes() {
    CROW_LOG_INFO << "Setting up routes...";

    CROW_ROUTE(app, "/")([this](){
        const auto& info = mcpServer.serverInfo();
        return crow::response(200, "text/plain", info.name + " " + info.version + "\nPOST JSON-RPC messages to /mcp\n");
    });

    mcpRouteHandlers->registerRoutes(app);

    CROW_LOG_INFO << "Routes set up completed";
}

void APIServer::setupCORS() {
    auto& cors = app.get_middleware<crow::CORSHandler>();
    cors.global()
        .headers("*")
        .methods("GET"_method, "POST"_method, "DELETE"_method);
}

void APIServer::setupHeartbeat(std::chrono::milliseconds interval) {
    heartbeatWorker = std::make_shared<HeartbeatWorker>(sessionManager, mcpServer.metrics(), interval);
    heartbeatWorker->start();
}

void APIServer::run(int port, size_t threads) {
    CROW_LOG_INFO << "Server starting on port " << port << "...";
    app.port(static_cast<uint16_t>(port))
       .server_name(mcpServer.serverInfo().name)
       .concurrency(static_cast<uint16_t>(threads))
       .run();
}

void APIServer::stop() {
    heartbeatWorker->stop();
    sessionManager->closeAll();
    app.stop();
}

} // namespace toolhost
