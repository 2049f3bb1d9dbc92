#pragma once

#include "mcp_types.hpp"
#include <crow.h>
#include <string>
#include <vector>

namespace toolhost {

class MCPClientCapabilitiesDetector {
public:
    // Detect client capabilities from initialize params
    static MCPClientCapabilities detectFromInitialize(const crow::json::rvalue& params);

    // Client info is optional; missing fields stay empty
    static MCPClientInfo detectClientInfo(const crow::json::rvalue& params);

    // Echo the client's version when supported, else fall back to the server's
    static std::string negotiateProtocolVersion(const std::string& requested,
                                                const std::string& server_version);
    static bool isSupportedProtocolVersion(const std::string& version);
    static const std::vector<std::string>& supportedProtocolVersions();

private:
    static std::vector<std::string> extractSupportedProtocols(const crow::json::rvalue& capabilities);
    // true for `"name": true` and for `"name": {...}`
    static bool extractCapability(const crow::json::rvalue& capabilities,
                                  const std::string& capability_name);
};

} // namespace toolhost
