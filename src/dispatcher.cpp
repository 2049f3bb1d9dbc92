#include "dispatcher.hpp"
#include "json_utils.hpp"
#include "mcp_client_capabilities.hpp"
#include "mcp_constants.hpp"
#include "mcp_error_builder.hpp"
#include "mcp_request_validator.hpp"
#include "protocol_codec.hpp"
#include <crow.h>

namespace toolhost {

namespace constants = toolhost::mcp::constants;

namespace {

std::string describeId(const std::optional<RequestId>& id) {
    return id ? requestIdToString(*id) : std::string("none");
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<ToolRegistry> registry,
                       std::shared_ptr<SchemaValidator> validator,
                       std::shared_ptr<ToolMetricsRegistry> metrics,
                       MCPServerInfo server_info)
    : registry_(std::move(registry)),
      validator_(std::move(validator)),
      metrics_(std::move(metrics)),
      server_info_(std::move(server_info)) {}

Status Dispatcher::handleLine(const std::string& line, ConnectionContext& context, FrameWriter& writer) const {
    auto decoded = ProtocolCodec::decodeRequest(line);
    if (!decoded) {
        const auto& failure = decoded.error();
        CROW_LOG_WARNING << "Rejected message (" << failure.error.code << " " << failure.error.message << ")";
        return writeResponse(writer, ProtocolCodec::failureResponse(failure));
    }
    return handleRequest(decoded.value(), context, writer);
}

Status Dispatcher::handleRequest(const MCPRequest& request, ConnectionContext& context, FrameWriter& writer) const {
    context.touch();
    CROW_LOG_DEBUG << "MCP request: method=" << request.method << ", id=" << describeId(request.id);

    if (request.isNotification()) {
        handleNotification(request, context);
        return Status();
    }

    if (!isKnownMethod(request.method)) {
        return writeResponse(writer, MCPResponse::failure(request.id, MCPErrorBuilder::methodNotFound(request.method)));
    }

    if (!allowedBeforeInitialize(request.method) && !context.isInitialized()) {
        return writeResponse(writer, errorResponse(request, Error::NotInitialized(
            "Server not initialized", "initialize must be sent before " + request.method)));
    }

    if (request.method == constants::METHOD_TOOLS_CALL) {
        try {
            return handleToolsCallRequest(request, context, writer);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "Error handling MCP method '" << request.method << "' (id "
                           << describeId(request.id) << "): " << e.what();
            return writeResponse(writer, MCPResponse::failure(request.id, MCPErrorBuilder::internalError(e.what())));
        }
    }

    return writeResponse(writer, handleMessage(request, context));
}

bool Dispatcher::isStreamingCall(const MCPRequest& request) const {
    if (request.method != constants::METHOD_TOOLS_CALL || request.isNotification()) {
        return false;
    }
    auto name = JsonUtils::extractOptionalString(request.params, "name");
    return name && registry_->isStreaming(*name);
}

MCPServerCapabilities Dispatcher::serverCapabilities() const {
    MCPServerCapabilities capabilities;
    capabilities.tools_list_changed = true;
    capabilities.resources = resource_provider_ != nullptr;
    capabilities.sampling = sampling_backend_ != nullptr;
    return capabilities;
}

void Dispatcher::handleNotification(const MCPRequest& request, ConnectionContext& context) const {
    if (request.method == constants::NOTIFICATION_INITIALIZED) {
        CROW_LOG_INFO << "Client confirmed initialization on connection " << context.id();
        return;
    }

    if (request.method == constants::NOTIFICATION_CANCELLED) {
        auto errors = MCPRequestValidator::validateCancelledParams(request.params);
        if (!errors.empty()) {
            CROW_LOG_WARNING << "Ignoring malformed cancellation: " << joinErrors(errors);
            return;
        }

        const auto& raw_id = request.params["requestId"];
        RequestId target = JsonUtils::isString(raw_id)
            ? RequestId(JsonUtils::extractString(raw_id))
            : RequestId(*JsonUtils::toInt64(raw_id));

        if (context.cancelRequest(target)) {
            CROW_LOG_INFO << "Cancelled request " << requestIdToString(target);
        } else {
            CROW_LOG_DEBUG << "Cancellation for unknown request " << requestIdToString(target);
        }
        return;
    }

    // Notifications never get a response, not even an error
    CROW_LOG_DEBUG << "Ignoring notification: " << request.method;
}

MCPResponse Dispatcher::handleMessage(const MCPRequest& request, ConnectionContext& context) const {
    try {
        auto errors = MCPRequestValidator::validateParamsForMethod(request.method, request.params);
        if (!errors.empty()) {
            return MCPResponse::failure(request.id, MCPErrorBuilder::invalidParams(joinErrors(errors)));
        }

        if (request.method == constants::METHOD_INITIALIZE) {
            return handleInitializeRequest(request, context);
        } else if (request.method == constants::METHOD_PING) {
            return MCPResponse::success(request.id, crow::json::wvalue::object());
        } else if (request.method == constants::METHOD_TOOLS_LIST) {
            return handleToolsListRequest(request);
        } else if (request.method == constants::METHOD_RESOURCES_LIST) {
            return handleResourcesListRequest(request);
        } else if (request.method == constants::METHOD_SAMPLING) {
            return handleSamplingRequest(request);
        }

        return MCPResponse::failure(request.id, MCPErrorBuilder::methodNotFound(request.method));
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Error handling MCP method '" << request.method << "' (id "
                       << describeId(request.id) << "): " << e.what();
        return MCPResponse::failure(request.id, MCPErrorBuilder::internalError(e.what()));
    }
}

MCPResponse Dispatcher::handleInitializeRequest(const MCPRequest& request, ConnectionContext& context) const {
    auto previous = context.initializeResult();
    if (previous) {
        CROW_LOG_DEBUG << "Repeated initialize on connection " << context.id() << ", returning original result";
        return MCPResponse::success(request.id, std::move(*previous));
    }

    auto requested = JsonUtils::extractOptionalString(request.params, "protocolVersion").value_or("");
    auto version = MCPClientCapabilitiesDetector::negotiateProtocolVersion(requested, server_info_.protocol_version);
    if (!requested.empty() && requested != version) {
        CROW_LOG_INFO << "Client requested protocol " << requested << ", answering with " << version;
    }

    crow::json::wvalue result;
    result["protocolVersion"] = version;
    result["capabilities"] = serverCapabilities().toJson();
    result["serverInfo"]["name"] = server_info_.name;
    result["serverInfo"]["version"] = server_info_.version;

    auto stored = context.completeInitialize(
        MCPClientCapabilitiesDetector::detectFromInitialize(request.params),
        MCPClientCapabilitiesDetector::detectClientInfo(request.params),
        version,
        std::move(result));
    return MCPResponse::success(request.id, std::move(stored));
}

MCPResponse Dispatcher::handleToolsListRequest(const MCPRequest& request) const {
    auto tools = registry_->listTools();
    CROW_LOG_DEBUG << "Tools list request: found " << tools.size() << " tools";

    crow::json::wvalue tool_list = crow::json::wvalue::list();
    for (size_t i = 0; i < tools.size(); ++i) {
        tool_list[i] = tools[i].toToolDefinition();
    }

    crow::json::wvalue result;
    result["tools"] = std::move(tool_list);
    return MCPResponse::success(request.id, std::move(result));
}

MCPResponse Dispatcher::handleResourcesListRequest(const MCPRequest& request) const {
    if (!resource_provider_) {
        return errorResponse(request, Error::NotConfigured("Resources not configured",
                                                           "No resource provider is available"));
    }

    auto resources = resource_provider_->listResources();
    if (!resources) {
        return errorResponse(request, resources.error());
    }

    crow::json::wvalue resource_list = crow::json::wvalue::list();
    const auto& descriptors = resources.value();
    for (size_t i = 0; i < descriptors.size(); ++i) {
        resource_list[i] = descriptors[i].toJson();
    }

    crow::json::wvalue result;
    result["resources"] = std::move(resource_list);
    return MCPResponse::success(request.id, std::move(result));
}

MCPResponse Dispatcher::handleSamplingRequest(const MCPRequest& request) const {
    auto sampling_request = MCPRequestValidator::parseSamplingRequest(request.params);
    if (!sampling_request) {
        return errorResponse(request, sampling_request.error());
    }

    if (!sampling_backend_) {
        return errorResponse(request, Error::NotConfigured("Sampling not configured",
                                                           "No sampling backend is available"));
    }

    auto sampled = sampling_backend_->createMessage(sampling_request.value());
    if (!sampled) {
        return errorResponse(request, sampled.error());
    }
    return MCPResponse::success(request.id, sampled.value().toJson());
}

Status Dispatcher::handleToolsCallRequest(const MCPRequest& request, ConnectionContext& context,
                                          FrameWriter& writer) const {
    auto errors = MCPRequestValidator::validateToolsCallParams(request.params);
    if (!errors.empty()) {
        return writeResponse(writer, MCPResponse::failure(request.id, MCPErrorBuilder::invalidParams(joinErrors(errors))));
    }

    const auto& params = request.params;
    const std::string tool_name = JsonUtils::extractString(params["name"]);
    CROW_LOG_DEBUG << "Tool call request: " << tool_name;

    // Absent or null arguments are checked as an empty object
    crow::json::rvalue empty_arguments = crow::json::load("{}");
    const crow::json::rvalue* arguments = &empty_arguments;
    if (params.has("arguments") && JsonUtils::isObject(params["arguments"])) {
        arguments = &params["arguments"];
    }

    if (!validator_->hasSchema(tool_name) && !registry_->hasTool(tool_name)) {
        return writeResponse(writer, errorResponse(request, Error::NotFound("Tool not found: " + tool_name, tool_name)));
    }

    auto valid = validator_->validate(tool_name, *arguments);
    if (!valid) {
        CROW_LOG_DEBUG << "Arguments for tool '" << tool_name << "' rejected: " << valid.error().describe();
        return writeResponse(writer, errorResponse(request, valid.error()));
    }

    auto entry = registry_->resolve(tool_name);
    if (!entry) {
        return writeResponse(writer, errorResponse(request, entry.error()));
    }

    const Tool& tool = std::visit([](const auto& resolved) -> const Tool& { return *resolved; }, entry.value());
    auto accepted = tool.validateInputs(*arguments);
    if (!accepted) {
        CROW_LOG_DEBUG << "Tool '" << tool_name << "' rejected its arguments: " << accepted.error().describe();
        return writeResponse(writer, errorResponse(request, accepted.error()));
    }

    if (const auto* unary = std::get_if<std::shared_ptr<UnaryTool>>(&entry.value())) {
        return writeResponse(writer, executeUnaryTool(request, tool_name, *unary, *arguments));
    }

    const auto& streaming = std::get<std::shared_ptr<StreamingTool>>(entry.value());
    return executeStreamingTool(request, tool_name, streaming, *arguments, context, writer);
}

MCPResponse Dispatcher::executeUnaryTool(const MCPRequest& request, const std::string& tool_name,
                                         const std::shared_ptr<UnaryTool>& tool,
                                         const crow::json::rvalue& arguments) const {
    ScopedToolTimer timer(metrics_->forTool(tool_name));
    ToolResponse response;

    try {
        auto result = tool->execute(arguments);
        if (result) {
            response = result.value();
        } else {
            response = ToolResponse::failure(result.error().describe());
        }
    } catch (const std::exception& e) {
        response = ToolResponse::failure(std::string("Tool execution failed: ") + e.what());
    }

    if (response.is_error) {
        timer.markFailed();
        CROW_LOG_WARNING << "Tool '" << tool_name << "' reported an error: " << response.content;
    }

    // An application-level failure is still a successful protocol result
    return MCPResponse::success(request.id, response.toJson());
}

Status Dispatcher::executeStreamingTool(const MCPRequest& request, const std::string& tool_name,
                                        const std::shared_ptr<StreamingTool>& tool,
                                        const crow::json::rvalue& arguments,
                                        ConnectionContext& context, FrameWriter& writer) const {
    InFlightRequest in_flight(context, *request.id);
    if (!in_flight.accepted()) {
        return writer.writeFrame(ProtocolCodec::encodeResponse(MCPResponse::failure(
            request.id, MCPErrorBuilder::invalidRequest("Request id " + describeId(request.id) + " is already in flight"))));
    }
    ScopedToolTimer timer(metrics_->forTool(tool_name));

    std::unique_ptr<ChunkStream> stream;
    try {
        auto started = tool->executeStreaming(arguments);
        if (!started) {
            timer.markFailed();
            CROW_LOG_WARNING << "Tool '" << tool_name << "' failed to start: " << started.error().describe();
            return writer.writeFrame(StreamEncoder::errorFrame(request.id, started.error()));
        }
        stream = std::move(started.value());
    } catch (const std::exception& e) {
        timer.markFailed();
        CROW_LOG_WARNING << "Tool '" << tool_name << "' threw while starting: " << e.what();
        return writer.writeFrame(StreamEncoder::errorFrame(
            request.id, Error::ToolExecution("Tool execution failed", e.what())));
    }

    if (!stream) {
        timer.markFailed();
        CROW_LOG_ERROR << "Tool '" << tool_name << "' returned no stream (id " << describeId(request.id) << ")";
        return writer.writeFrame(StreamEncoder::errorFrame(
            request.id, Error::Internal("Tool returned no stream", tool_name)));
    }

    auto drained = StreamEncoder::drain(*stream, request.id, writer, in_flight.token());
    if (!drained) {
        timer.markFailed();
        return std::move(drained.error());
    }

    const auto& summary = drained.value();
    if (summary.outcome == StreamOutcome::Failed) {
        timer.markFailed();
    } else if (summary.outcome == StreamOutcome::Cancelled) {
        CROW_LOG_INFO << "Stream for request " << describeId(request.id) << " cancelled after "
                      << summary.chunks_sent << " chunk(s)";
    }
    return Status();
}

bool Dispatcher::isKnownMethod(const std::string& method) {
    return method == constants::METHOD_INITIALIZE ||
           method == constants::METHOD_PING ||
           method == constants::METHOD_TOOLS_LIST ||
           method == constants::METHOD_TOOLS_CALL ||
           method == constants::METHOD_RESOURCES_LIST ||
           method == constants::METHOD_SAMPLING;
}

bool Dispatcher::allowedBeforeInitialize(const std::string& method) {
    return method == constants::METHOD_INITIALIZE || method == constants::METHOD_PING;
}

MCPResponse Dispatcher::errorResponse(const MCPRequest& request, const Error& error) {
    return MCPResponse::failure(request.id, MCPErrorBuilder::fromError(error));
}

Status Dispatcher::writeResponse(FrameWriter& writer, const MCPResponse& response) {
    return writer.writeFrame(ProtocolCodec::encodeResponse(response));
}

} // namespace toolhost
