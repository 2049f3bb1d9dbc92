#pragma once

#include <string>
#include <chrono>
#include <cstddef>

namespace toolhost::mcp::constants {

// JSON-RPC 2.0 Specification Constants
constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* MCP_SESSION_HEADER = "Mcp-Session-Id";
constexpr int DEFAULT_SESSION_TIMEOUT_MINUTES = 30;

// Cap on the NDJSON body of one streaming call over HTTP
constexpr size_t DEFAULT_MAX_STREAM_RESPONSE_BYTES = 8 * 1024 * 1024;

// Server identity defaults
constexpr const char* SERVER_NAME = "toolhost";
constexpr const char* SERVER_VERSION = "0.1.0";

// MCP Protocol Version Constants
constexpr const char* MCP_DEFAULT_PROTOCOL_VERSION = "2024-11-05";
constexpr const char* MCP_PROTOCOL_VERSION_2025_06_18 = "2025-06-18";
constexpr const char* MCP_PROTOCOL_VERSION_2025_03_26 = "2025-03-26";
constexpr const char* MCP_PROTOCOL_VERSION_2024_11_05 = "2024-11-05";

// HTTP Status Codes
constexpr int HTTP_OK = 200;
constexpr int HTTP_NO_CONTENT = 204;
constexpr int HTTP_ACCEPTED = 202;
constexpr int HTTP_BAD_REQUEST = 400;
constexpr int HTTP_NOT_FOUND = 404;
constexpr int HTTP_INTERNAL_SERVER_ERROR = 500;
constexpr int HTTP_SERVICE_UNAVAILABLE = 503;

// JSON-RPC Error Codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Domain error codes, outside the reserved -32768..-32000 range
constexpr int TOOL_NOT_FOUND = -31001;
constexpr int VALIDATION_ERROR = -31002;
constexpr int NOT_CONFIGURED = -31003;
constexpr int TOOL_EXECUTION_ERROR = -31004;
constexpr int NOT_INITIALIZED = -31005;
constexpr int TRANSPORT_ERROR = -31006;
constexpr int REQUEST_CANCELLED = -31007;

// Content Types
constexpr const char* CONTENT_TYPE_JSON = "application/json";
constexpr const char* CONTENT_TYPE_NDJSON = "application/x-ndjson";

// MCP Protocol Methods
constexpr const char* METHOD_INITIALIZE = "initialize";
constexpr const char* METHOD_TOOLS_LIST = "tools/list";
constexpr const char* METHOD_TOOLS_CALL = "tools/call";
constexpr const char* METHOD_RESOURCES_LIST = "resources/list";
constexpr const char* METHOD_SAMPLING = "sampling";
constexpr const char* METHOD_PING = "ping";
constexpr const char* NOTIFICATION_INITIALIZED = "notifications/initialized";
constexpr const char* NOTIFICATION_CANCELLED = "notifications/cancelled";

// Stream frame discriminators
constexpr const char* FRAME_STREAM_CHUNK = "stream_chunk";
constexpr const char* FRAME_STREAM_COMPLETE = "stream_complete";

// Server Capabilities
constexpr const char* CAPABILITY_TOOLS = "tools";
constexpr const char* CAPABILITY_RESOURCES = "resources";
constexpr const char* CAPABILITY_SAMPLING = "sampling";

} // namespace toolhost::mcp::constants
