#pragma once

#include "error.hpp"
#include "mcp_types.hpp"
#include <crow.h>
#include <string>
#include <vector>

namespace toolhost {

/**
 * Method-level shape checks for request params.
 *
 * Every check returns its own list of problems (empty means valid), so the
 * validator can be used from any number of request threads at once.
 */
class MCPRequestValidator {
public:
    static std::vector<std::string> validateParamsForMethod(const std::string& method,
                                                            const crow::json::rvalue& params);

    static std::vector<std::string> validateInitializeParams(const crow::json::rvalue& params);
    static std::vector<std::string> validateToolsCallParams(const crow::json::rvalue& params);
    static std::vector<std::string> validateSamplingParams(const crow::json::rvalue& params);
    static std::vector<std::string> validateCancelledParams(const crow::json::rvalue& params);

    // Shape-checked sampling params; invalid params yield an invalid-params Error
    static Result<SamplingRequest> parseSamplingRequest(const crow::json::rvalue& params);

    // HTTP validation
    static bool validateContentType(const std::string& content_type);

    // Utility methods
    static bool isValidJsonRpcVersion(const std::string& version);

    // True when params were sent and are not null
    static bool hasParams(const crow::json::rvalue& params);

private:
    static void requireObjectOrAbsent(const crow::json::rvalue& params, const std::string& method,
                                      std::vector<std::string>& errors);
};

} // namespace toolhost
