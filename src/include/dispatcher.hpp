#pragma once

#include "connection_context.hpp"
#include "error.hpp"
#include "mcp_types.hpp"
#include "resource_provider.hpp"
#include "schema_validator.hpp"
#include "stream_encoder.hpp"
#include "tool_metrics.hpp"
#include "tool_registry.hpp"
#include <memory>
#include <string>

namespace toolhost {

/**
 * Dispatcher turns decoded requests into responses for one connection at a
 * time. It is shared by every connection and holds no per-connection state;
 * that lives in the ConnectionContext passed to each call.
 *
 * For tools/call the order is fixed: params shape, schema validation, tool
 * resolution, execution. Validation and resolution failures are reported
 * before any tool code runs.
 */
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<ToolRegistry> registry,
               std::shared_ptr<SchemaValidator> validator,
               std::shared_ptr<ToolMetricsRegistry> metrics,
               MCPServerInfo server_info);

    // Collaborators are optional; set them before serving
    void setResourceProvider(std::shared_ptr<ResourceProvider> provider) { resource_provider_ = std::move(provider); }
    void setSamplingBackend(std::shared_ptr<SamplingBackend> backend) { sampling_backend_ = std::move(backend); }

    // Decode one wire line and handle it. Output frames go to the writer.
    Status handleLine(const std::string& line, ConnectionContext& context, FrameWriter& writer) const;

    // Writes nothing for notifications, one response frame for unary methods,
    // and a frame sequence for streaming tool calls. Errors are write failures only.
    Status handleRequest(const MCPRequest& request, ConnectionContext& context, FrameWriter& writer) const;

    // True when the request would be answered with stream frames
    bool isStreamingCall(const MCPRequest& request) const;

    MCPServerCapabilities serverCapabilities() const;
    const MCPServerInfo& serverInfo() const { return server_info_; }

private:
    void handleNotification(const MCPRequest& request, ConnectionContext& context) const;

    MCPResponse handleMessage(const MCPRequest& request, ConnectionContext& context) const;
    MCPResponse handleInitializeRequest(const MCPRequest& request, ConnectionContext& context) const;
    MCPResponse handleToolsListRequest(const MCPRequest& request) const;
    MCPResponse handleResourcesListRequest(const MCPRequest& request) const;
    MCPResponse handleSamplingRequest(const MCPRequest& request) const;

    Status handleToolsCallRequest(const MCPRequest& request, ConnectionContext& context, FrameWriter& writer) const;
    MCPResponse executeUnaryTool(const MCPRequest& request, const std::string& tool_name,
                                 const std::shared_ptr<UnaryTool>& tool, const crow::json::rvalue& arguments) const;
    Status executeStreamingTool(const MCPRequest& request, const std::string& tool_name,
                                const std::shared_ptr<StreamingTool>& tool, const crow::json::rvalue& arguments,
                                ConnectionContext& context, FrameWriter& writer) const;

    static bool isKnownMethod(const std::string& method);
    static bool allowedBeforeInitialize(const std::string& method);
    static MCPResponse errorResponse(const MCPRequest& request, const Error& error);
    static Status writeResponse(FrameWriter& writer, const MCPResponse& response);

    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<SchemaValidator> validator_;
    std::shared_ptr<ToolMetricsRegistry> metrics_;
    std::shared_ptr<ResourceProvider> resource_provider_;
    std::shared_ptr<SamplingBackend> sampling_backend_;
    MCPServerInfo server_info_;
};

} // namespace toolhost
