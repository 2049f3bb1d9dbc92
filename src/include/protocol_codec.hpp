#pragma once

#include "error.hpp"
#include "mcp_types.hpp"
#include <crow.h>
#include <optional>
#include <string>

namespace toolhost {

// Why a message could not be decoded; id is echoed when it could be recovered
struct DecodeFailure {
    MCPError error;
    std::optional<RequestId> id;
};

/**
 * ProtocolCodec converts between newline-delimited JSON-RPC 2.0 text and the
 * MCPRequest / MCPResponse types. It never throws: malformed input becomes a
 * DecodeFailure carrying the reserved error to send back.
 */
class ProtocolCodec {
public:
    static Expected<MCPRequest, DecodeFailure> decodeRequest(const std::string& line);
    static Expected<MCPResponse, DecodeFailure> decodeResponse(const std::string& line);

    // Single line, no trailing newline. Exactly one of result/error; id omitted when absent.
    static std::string encodeResponse(const MCPResponse& response);
    static std::string encodeRequest(const MCPRequest& request);

    static crow::json::wvalue responseToJson(const MCPResponse& response);
    static crow::json::wvalue errorToJson(const MCPError& error);

    // Response to a message that failed to decode
    static MCPResponse failureResponse(const DecodeFailure& failure);

private:
    // Reads the id member; returns false when it is present but not a valid id
    static bool extractId(const crow::json::rvalue& message, std::optional<RequestId>& id);
    static bool hasValidVersion(const crow::json::rvalue& message);
};

} // namespace toolhost
