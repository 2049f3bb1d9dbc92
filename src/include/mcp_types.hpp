#pragma once

#include <crow.h>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolhost {

// JSON-RPC id: integer or string. A missing or null id marks a notification.
using RequestId = std::variant<int64_t, std::string>;

std::string requestIdToString(const RequestId& id);
crow::json::wvalue requestIdToJson(const RequestId& id);

// Core JSON-RPC types
struct MCPRequest {
    std::string jsonrpc = "2.0";
    std::optional<RequestId> id;
    std::string method;
    // Owning decoded document; Null when the message had no params
    crow::json::rvalue params;

    MCPRequest() = default;
    MCPRequest(MCPRequest&&) = default;
    MCPRequest& operator=(MCPRequest&&) = default;
    // Copies would alias the params buffer
    MCPRequest(const MCPRequest&) = delete;
    MCPRequest& operator=(const MCPRequest&) = delete;

    bool isNotification() const { return !id.has_value(); }
    bool hasParams() const;
};

// JSON-RPC error object
struct MCPError {
    int code;
    std::string message;
    std::optional<crow::json::wvalue> data;

    MCPError(int error_code, const std::string& error_message)
        : code(error_code), message(error_message) {}
    MCPError(int error_code, const std::string& error_message, crow::json::wvalue error_data)
        : code(error_code), message(error_message), data(std::move(error_data)) {}
};

// Exactly one of result/error is set
struct MCPResponse {
    std::string jsonrpc = "2.0";
    std::optional<RequestId> id;
    std::optional<crow::json::wvalue> result;
    std::optional<MCPError> error;

    static MCPResponse success(std::optional<RequestId> id, crow::json::wvalue result);
    static MCPResponse failure(std::optional<RequestId> id, MCPError error);

    bool isError() const { return error.has_value(); }
};

// Capability sets negotiated once at initialize
struct MCPClientCapabilities {
    bool supports_sampling = false;
    bool supports_resources = false;
    bool supports_roots = false;
    bool supports_caching = false;
    std::vector<std::string> supported_protocols;

    MCPClientCapabilities() = default;
};

struct MCPServerCapabilities {
    bool tools_list_changed = true;
    bool resources = false;
    bool resources_subscribe = false;
    bool sampling = false;

    crow::json::wvalue toJson() const;
};

struct MCPClientInfo {
    std::string name;
    std::string version;
};

struct MCPServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;

    MCPServerInfo() = default;
};

// Tool description surfaced by tools/list
struct ToolMetadata {
    std::string name;
    std::string description;
    crow::json::wvalue input_schema;
    std::string version;

    crow::json::wvalue toToolDefinition() const;
};

// Terminal result of a unary tool call
struct ToolResponse {
    std::string content;
    bool is_error = false;

    static ToolResponse text(const std::string& content) { return ToolResponse{content, false}; }
    static ToolResponse failure(const std::string& content) { return ToolResponse{content, true}; }

    crow::json::wvalue toJson() const;
};

// Sampling is forwarded to a model collaborator; the core only validates shape
struct SamplingMessage {
    std::string role;
    std::string content;
};

struct SamplingRequest {
    std::string model;
    int64_t max_tokens = 0;
    std::optional<std::string> system;
    std::vector<SamplingMessage> messages;
};

struct SamplingResponse {
    std::string model;
    std::string content;
    std::string stop_reason;

    crow::json::wvalue toJson() const;
};

// A listed resource, as returned by a resource collaborator
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;

    crow::json::wvalue toJson() const;
};

} // namespace toolhost
