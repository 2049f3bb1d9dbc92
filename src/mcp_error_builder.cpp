#include "mcp_error_builder.hpp"
#include "mcp_constants.hpp"

namespace toolhost {

namespace constants = toolhost::mcp::constants;

MCPError MCPErrorBuilder::parseError(const std::string& details) {
    return withDetails(constants::PARSE_ERROR, "Parse error", details);
}

MCPError MCPErrorBuilder::invalidRequest(const std::string& details) {
    return withDetails(constants::INVALID_REQUEST, "Invalid Request", details);
}

MCPError MCPErrorBuilder::methodNotFound(const std::string& method) {
    return withDetails(constants::METHOD_NOT_FOUND, "Method not found",
                       method.empty() ? "" : "Unknown method: " + method);
}

MCPError MCPErrorBuilder::invalidParams(const std::string& details) {
    return withDetails(constants::INVALID_PARAMS, "Invalid params", details);
}

MCPError MCPErrorBuilder::internalError(const std::string& details) {
    return withDetails(constants::INTERNAL_ERROR, "Internal error", details);
}

MCPError MCPErrorBuilder::fromError(const Error& error) {
    if (error.category == ErrorCategory::Protocol) {
        return withDetails(error.code, error.message, error.details);
    }
    return MCPError(error.code, error.message, error.toData());
}

Error MCPErrorBuilder::protocolError(const MCPError& error) {
    std::string details;
    if (error.data && error.data->t() == crow::json::type::Object) {
        auto data = crow::json::load(error.data->dump());
        if (data && data.has("details") && data["details"].t() == crow::json::type::String) {
            details = std::string(data["details"].s());
        }
    }
    return Error::Protocol(error.code, error.message, details);
}

MCPError MCPErrorBuilder::withDetails(int code, const std::string& message, const std::string& details) {
    if (details.empty()) {
        return MCPError(code, message);
    }

    crow::json::wvalue data;
    data["details"] = details;
    return MCPError(code, message, std::move(data));
}

} // namespace toolhost
