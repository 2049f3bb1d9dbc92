#pragma once

#include <crow.h>
#include "crow/middlewares/cors.h"
#include <memory>

#include "heartbeat_worker.hpp"
#include "mcp_route_handlers.hpp"
#include "mcp_server.hpp"
#include "mcp_session_manager.hpp"

namespace toolhost {

// HTTP front end: Crow app, MCP routes, session housekeeping
class APIServer
{
public:
    explicit APIServer(McpServer& mcp_server,
                       std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(60),
                       size_t max_stream_bytes = mcp::constants::DEFAULT_MAX_STREAM_RESPONSE_BYTES);
    ~APIServer();

    // Blocks until stop() is called
    void run(int port, size_t threads);
    void stop();

    std::shared_ptr<MCPSessionManager> getSessionManager() const { return sessionManager; }

private:
    void setupRoutes();
    void setupCORS();
    void setupHeartbeat(std::chrono::milliseconds interval);

    ToolhostApp app;
    McpServer& mcpServer;
    std::shared_ptr<MCPSessionManager> sessionManager;
    std::unique_ptr<MCPRouteHandlers> mcpRouteHandlers;
    std::shared_ptr<HeartbeatWorker> heartbeatWorker;
};

} // namespace toolhost
