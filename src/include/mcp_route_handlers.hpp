#pragma once

#include <crow.h>
#include "crow/middlewares/cors.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dispatcher.hpp"
#include "mcp_constants.hpp"
#include "mcp_session_manager.hpp"
#include "stream_encoder.hpp"
#include "tool_metrics.hpp"
#include "tool_registry.hpp"

namespace toolhost {

using ToolhostApp = crow::App<crow::CORSHandler>;

// Collects frames in memory; an HTTP body is assembled from them afterwards.
// A frame that would take the total past max_bytes is refused with a Transport error.
class BufferedFrameWriter : public FrameWriter {
public:
    explicit BufferedFrameWriter(size_t max_bytes = mcp::constants::DEFAULT_MAX_STREAM_RESPONSE_BYTES)
        : max_bytes_(max_bytes) {}

    Status writeFrame(const std::string& frame) override;

    const std::vector<std::string>& frames() const { return frames_; }
    size_t bufferedBytes() const { return buffered_bytes_; }
    bool overflowed() const { return overflowed_; }

private:
    size_t max_bytes_;
    size_t buffered_bytes_ = 0;
    bool overflowed_ = false;
    std::vector<std::string> frames_;
};

/**
 * MCPRouteHandlers exposes the dispatcher over HTTP.
 *
 *   POST   /mcp         one JSON-RPC message; JSON response, or NDJSON frames for streaming calls
 *   DELETE /mcp         closes the session named by the Mcp-Session-Id header
 *   GET    /mcp/health  status, tool count and per-tool metrics
 *
 * A POST without the session header opens a new session; the id is returned
 * in the same header.
 */
class MCPRouteHandlers {
public:
    MCPRouteHandlers(const Dispatcher& dispatcher,
                     std::shared_ptr<MCPSessionManager> session_manager,
                     std::shared_ptr<ToolRegistry> registry,
                     std::shared_ptr<ToolMetricsRegistry> metrics,
                     size_t max_stream_bytes = mcp::constants::DEFAULT_MAX_STREAM_RESPONSE_BYTES);

    void registerRoutes(ToolhostApp& app);

    crow::response handlePost(const crow::request& req) const;
    crow::response handleDelete(const crow::request& req) const;
    crow::response handleHealth() const;

private:
    static std::optional<std::string> extractSessionIdFromRequest(const crow::request& req);
    static void addSessionHeaderToResponse(crow::response& resp, const std::string& session_id);
    static crow::response createJsonResponse(int code, const std::string& body);
    static crow::response createErrorResponse(int code, const Error& error);

    const Dispatcher& dispatcher_;
    std::shared_ptr<MCPSessionManager> session_manager_;
    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<ToolMetricsRegistry> metrics_;
    size_t max_stream_bytes_;
};

} // namespace toolhost
