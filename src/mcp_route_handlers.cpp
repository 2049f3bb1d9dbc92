#include "mcp_route_handlers.hpp"
#include "mcp_constants.hpp"
#include "mcp_request_validator.hpp"
#include "protocol_codec.hpp"
#include <limits>
#include <sstream>

namespace toolhost {

namespace constants = toolhost::mcp::constants;

Status BufferedFrameWriter::writeFrame(const std::string& frame) {
    // +1 for the newline each frame gets in the body
    size_t frame_bytes = frame.size() + 1;
    if (overflowed_ || buffered_bytes_ + frame_bytes > max_bytes_) {
        overflowed_ = true;
        return Error::Transport("Response buffer full",
                                "frames beyond " + std::to_string(max_bytes_) + " bytes are not buffered");
    }
    buffered_bytes_ += frame_bytes;
    frames_.push_back(frame);
    return Status();
}

MCPRouteHandlers::MCPRouteHandlers(const Dispatcher& dispatcher,
                                   std::shared_ptr<MCPSessionManager> session_manager,
                                   std::shared_ptr<ToolRegistry> registry,
                                   std::shared_ptr<ToolMetricsRegistry> metrics,
                                   size_t max_stream_bytes)
    : dispatcher_(dispatcher),
      session_manager_(std::move(session_manager)),
      registry_(std::move(registry)),
      metrics_(std::move(metrics)),
      max_stream_bytes_(max_stream_bytes) {}

void MCPRouteHandlers::registerRoutes(ToolhostApp& app) {
    CROW_LOG_INFO << "Registering MCP routes with application...";

    CROW_ROUTE(app, "/mcp")
        .methods("POST"_method)
        ([this](const crow::request& req) -> crow::response {
            try {
                return handlePost(req);
            } catch (const std::exception& e) {
                CROW_LOG_ERROR << "Error handling MCP request: " << e.what();
                return createErrorResponse(constants::HTTP_INTERNAL_SERVER_ERROR,
                                           Error::Internal("Internal error", e.what()));
            }
        });

    CROW_ROUTE(app, "/mcp")
        .methods("DELETE"_method)
        ([this](const crow::request& req) -> crow::response {
            return handleDelete(req);
        });

    CROW_ROUTE(app, "/mcp/health")
        .methods("GET"_method)
        ([this]() -> crow::response {
            return handleHealth();
        });

    CROW_LOG_INFO << "MCP routes registered with application";
}

crow::response MCPRouteHandlers::handlePost(const crow::request& req) const {
    auto content_type = req.get_header_value("Content-Type");
    if (!content_type.empty() && !MCPRequestValidator::validateContentType(content_type)) {
        return createErrorResponse(constants::HTTP_BAD_REQUEST,
                                   Error::Protocol(constants::INVALID_REQUEST, "Unsupported content type", content_type));
    }

    std::shared_ptr<ConnectionContext> session;
    auto session_id = extractSessionIdFromRequest(req);
    if (session_id) {
        session = session_manager_->getSession(*session_id);
        if (!session) {
            CROW_LOG_DEBUG << "Unknown or expired MCP session " << *session_id;
            return createErrorResponse(constants::HTTP_NOT_FOUND, Error::NotFound("Session not found", *session_id));
        }
    } else {
        session = session_manager_->createSession();
    }

    auto decoded = ProtocolCodec::decodeRequest(req.body);
    if (!decoded) {
        CROW_LOG_DEBUG << "Rejected MCP message: " << decoded.error().error.message;
        auto resp = createJsonResponse(constants::HTTP_OK,
                                       ProtocolCodec::encodeResponse(ProtocolCodec::failureResponse(decoded.error())));
        addSessionHeaderToResponse(resp, session->id());
        return resp;
    }

    const MCPRequest& request = decoded.value();
    const bool streaming = dispatcher_.isStreamingCall(request);

    // Only a stream can grow without bound; a unary answer is a single frame
    BufferedFrameWriter writer(streaming ? max_stream_bytes_ : std::numeric_limits<size_t>::max());
    auto status = dispatcher_.handleRequest(request, *session, writer);
    if (!status && streaming && writer.overflowed()) {
        // The drain already cancelled the stream; close the body with an error frame
        CROW_LOG_WARNING << "Stream for " << request.method << " exceeded " << max_stream_bytes_
                         << " bytes after " << writer.frames().size() << " frame(s), cut off";
        std::ostringstream body;
        for (const auto& frame : writer.frames()) {
            body << frame << '\n';
        }
        body << StreamEncoder::errorFrame(request.id, Error::ToolExecution(
                    "Stream output exceeded the response limit",
                    std::to_string(max_stream_bytes_) + " bytes")) << '\n';

        crow::response resp(constants::HTTP_OK);
        resp.set_header("Content-Type", constants::CONTENT_TYPE_NDJSON);
        resp.body = body.str();
        addSessionHeaderToResponse(resp, session->id());
        return resp;
    }
    if (!status) {
        CROW_LOG_ERROR << "Failed to answer " << request.method << ": " << status.error().describe();
        return createErrorResponse(constants::HTTP_INTERNAL_SERVER_ERROR, status.error());
    }

    crow::response resp;
    const auto& frames = writer.frames();
    if (frames.empty()) {
        // Notifications produce no JSON-RPC response
        resp = crow::response(constants::HTTP_ACCEPTED);
    } else if (streaming) {
        std::ostringstream body;
        for (const auto& frame : frames) {
            body << frame << '\n';
        }
        resp = crow::response(constants::HTTP_OK);
        resp.set_header("Content-Type", constants::CONTENT_TYPE_NDJSON);
        resp.body = body.str();
    } else {
        resp = createJsonResponse(constants::HTTP_OK, frames.front());
    }

    addSessionHeaderToResponse(resp, session->id());
    return resp;
}

crow::response MCPRouteHandlers::handleDelete(const crow::request& req) const {
    auto session_id = extractSessionIdFromRequest(req);
    if (!session_id) {
        return createErrorResponse(constants::HTTP_BAD_REQUEST,
                                   Error::Validation("Missing session header", {}, constants::MCP_SESSION_HEADER));
    }
    if (!session_manager_->removeSession(*session_id)) {
        return createErrorResponse(constants::HTTP_NOT_FOUND, Error::NotFound("Session not found", *session_id));
    }

    CROW_LOG_INFO << "MCP session " << *session_id << " closed by client";
    return crow::response(constants::HTTP_NO_CONTENT);
}

crow::response MCPRouteHandlers::handleHealth() const {
    const auto& info = dispatcher_.serverInfo();

    crow::json::wvalue health;
    health["status"] = "healthy";
    health["server"] = info.name;
    health["version"] = info.version;
    health["protocolVersion"] = info.protocol_version;
    health["tools"] = static_cast<int>(registry_->toolCount());
    health["sessions"] = static_cast<int>(session_manager_->getActiveSessionCount());
    health["metrics"] = metrics_->toJson();
    return crow::response(constants::HTTP_OK, health);
}

std::optional<std::string> MCPRouteHandlers::extractSessionIdFromRequest(const crow::request& req) {
    std::string session_id = req.get_header_value(constants::MCP_SESSION_HEADER);
    if (session_id.empty()) {
        return std::nullopt;
    }
    return session_id;
}

void MCPRouteHandlers::addSessionHeaderToResponse(crow::response& resp, const std::string& session_id) {
    resp.set_header(constants::MCP_SESSION_HEADER, session_id);
}

crow::response MCPRouteHandlers::createJsonResponse(int code, const std::string& body) {
    crow::response resp(code);
    resp.set_header("Content-Type", constants::CONTENT_TYPE_JSON);
    resp.body = body;
    return resp;
}

crow::response MCPRouteHandlers::createErrorResponse(int code, const Error& error) {
    crow::json::wvalue body;
    body["error"] = error.toJson();
    return crow::response(code, body);
}

} // namespace toolhost
