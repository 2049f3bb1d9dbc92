#pragma once

#include "error.hpp"
#include "mcp_types.hpp"
#include <crow.h>
#include <string>

namespace toolhost {

/**
 * Named constructors for the five reserved JSON-RPC errors, so every call site
 * shares the same code and message text. Domain errors go through fromError().
 */
class MCPErrorBuilder {
public:
    static MCPError parseError(const std::string& details = "");
    static MCPError invalidRequest(const std::string& details = "");
    static MCPError methodNotFound(const std::string& method = "");
    static MCPError invalidParams(const std::string& details = "");
    static MCPError internalError(const std::string& details = "");

    // Map a categorized Error onto the wire error object
    static MCPError fromError(const Error& error);

    // The same reserved errors as categorized Error values
    static Error protocolError(const MCPError& error);

private:
    static MCPError withDetails(int code, const std::string& message, const std::string& details);
};

} // namespace toolhost
