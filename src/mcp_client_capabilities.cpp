#include "mcp_client_capabilities.hpp"
#include "json_utils.hpp"
#include "mcp_constants.hpp"
#include <algorithm>

namespace toolhost {

namespace constants = toolhost::mcp::constants;

MCPClientCapabilities MCPClientCapabilitiesDetector::detectFromInitialize(const crow::json::rvalue& params) {
    MCPClientCapabilities capabilities;

    if (!params || !JsonUtils::isObject(params) || !params.has("capabilities")) {
        return capabilities;
    }

    const auto& caps_obj = params["capabilities"];
    if (!JsonUtils::isObject(caps_obj)) {
        return capabilities;
    }

    capabilities.supports_sampling = extractCapability(caps_obj, constants::CAPABILITY_SAMPLING);
    capabilities.supports_resources = extractCapability(caps_obj, constants::CAPABILITY_RESOURCES);
    capabilities.supports_roots = extractCapability(caps_obj, "roots");
    capabilities.supports_caching = extractCapability(caps_obj, "caching");
    capabilities.supported_protocols = extractSupportedProtocols(caps_obj);

    return capabilities;
}

MCPClientInfo MCPClientCapabilitiesDetector::detectClientInfo(const crow::json::rvalue& params) {
    MCPClientInfo info;
    if (!params || !JsonUtils::isObject(params) || !params.has("clientInfo")) {
        return info;
    }

    const auto& client_info = params["clientInfo"];
    info.name = JsonUtils::extractOptionalString(client_info, "name").value_or("");
    info.version = JsonUtils::extractOptionalString(client_info, "version").value_or("");
    return info;
}

std::string MCPClientCapabilitiesDetector::negotiateProtocolVersion(const std::string& requested,
                                                                    const std::string& server_version) {
    if (!requested.empty() && isSupportedProtocolVersion(requested)) {
        return requested;
    }
    return server_version;
}

bool MCPClientCapabilitiesDetector::isSupportedProtocolVersion(const std::string& version) {
    const auto& versions = supportedProtocolVersions();
    return std::find(versions.begin(), versions.end(), version) != versions.end();
}

const std::vector<std::string>& MCPClientCapabilitiesDetector::supportedProtocolVersions() {
    static const std::vector<std::string> versions = {
        constants::MCP_PROTOCOL_VERSION_2025_06_18,
        constants::MCP_PROTOCOL_VERSION_2025_03_26,
        constants::MCP_PROTOCOL_VERSION_2024_11_05
    };
    return versions;
}

std::vector<std::string> MCPClientCapabilitiesDetector::extractSupportedProtocols(const crow::json::rvalue& capabilities) {
    std::vector<std::string> protocols;

    // Look for protocols in the individual capability objects
    for (const auto& cap_value : capabilities) {
        if (!JsonUtils::isObject(cap_value) || !cap_value.has("supportedProtocols")) {
            continue;
        }

        const auto& protocols_value = cap_value["supportedProtocols"];
        if (!JsonUtils::isArray(protocols_value)) {
            continue;
        }

        for (size_t i = 0; i < protocols_value.size(); ++i) {
            if (JsonUtils::isString(protocols_value[i])) {
                protocols.push_back(JsonUtils::extractString(protocols_value[i]));
            }
        }
    }

    return protocols;
}

bool MCPClientCapabilitiesDetector::extractCapability(const crow::json::rvalue& capabilities,
                                                      const std::string& capability_name) {
    if (!capabilities.has(capability_name)) {
        return false;
    }

    auto type = capabilities[capability_name].t();
    return type == crow::json::type::True || type == crow::json::type::Object;
}

} // namespace toolhost
