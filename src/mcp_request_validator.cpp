#include "mcp_request_validator.hpp"
#include "json_utils.hpp"
#include "mcp_constants.hpp"

namespace toolhost {

namespace constants = toolhost::mcp::constants;

std::vector<std::string> MCPRequestValidator::validateParamsForMethod(const std::string& method,
                                                                      const crow::json::rvalue& params) {
    if (method == constants::METHOD_INITIALIZE) {
        return validateInitializeParams(params);
    } else if (method == constants::METHOD_TOOLS_CALL) {
        return validateToolsCallParams(params);
    } else if (method == constants::METHOD_SAMPLING) {
        return validateSamplingParams(params);
    } else if (method == constants::NOTIFICATION_CANCELLED) {
        return validateCancelledParams(params);
    }

    // tools/list, resources/list and ping take an optional empty object
    std::vector<std::string> errors;
    requireObjectOrAbsent(params, method, errors);
    return errors;
}

std::vector<std::string> MCPRequestValidator::validateInitializeParams(const crow::json::rvalue& params) {
    std::vector<std::string> errors;
    if (!hasParams(params)) {
        return errors;
    }

    if (!JsonUtils::isObject(params)) {
        errors.emplace_back("Initialize params must be an object");
        return errors;
    }

    if (params.has("protocolVersion") && !JsonUtils::isString(params["protocolVersion"])) {
        errors.emplace_back("protocolVersion must be a string");
    }
    if (params.has("capabilities") && !JsonUtils::isObject(params["capabilities"])) {
        errors.emplace_back("capabilities must be an object");
    }
    if (params.has("clientInfo") && !JsonUtils::isObject(params["clientInfo"])) {
        errors.emplace_back("clientInfo must be an object");
    }

    return errors;
}

std::vector<std::string> MCPRequestValidator::validateToolsCallParams(const crow::json::rvalue& params) {
    std::vector<std::string> errors;

    if (!hasParams(params) || !JsonUtils::isObject(params)) {
        errors.emplace_back("Tools call params must be an object");
        return errors;
    }

    if (!params.has("name")) {
        errors.emplace_back("Tools call params must include 'name' field");
    } else {
        auto name_value = params["name"];
        if (!JsonUtils::isString(name_value)) {
            errors.emplace_back("Tool name must be a string");
        } else if (JsonUtils::extractString(name_value).empty()) {
            errors.emplace_back("Tool name must not be empty");
        }
    }

    if (params.has("arguments")) {
        auto arguments = params["arguments"];
        if (!JsonUtils::isObject(arguments) && !JsonUtils::isNull(arguments)) {
            errors.emplace_back("Tool arguments must be an object");
        }
    }

    return errors;
}

std::vector<std::string> MCPRequestValidator::validateSamplingParams(const crow::json::rvalue& params) {
    std::vector<std::string> errors;

    if (!hasParams(params) || !JsonUtils::isObject(params)) {
        errors.emplace_back("Sampling params must be an object");
        return errors;
    }

    auto model = JsonUtils::extractOptionalString(params, "model");
    if (!model || model->empty()) {
        errors.emplace_back("Model name required");
    }

    auto max_tokens = JsonUtils::extractInt(params, "maxTokens");
    if (!max_tokens || *max_tokens <= 0) {
        errors.emplace_back("maxTokens must be an integer > 0");
    }

    if (params.has("system") && !JsonUtils::isString(params["system"]) &&
        !JsonUtils::isNull(params["system"])) {
        errors.emplace_back("system must be a string");
    }

    if (!params.has("messages") || !JsonUtils::isArray(params["messages"])) {
        errors.emplace_back("messages must be an array");
        return errors;
    }

    const auto& messages = params["messages"];
    if (messages.size() == 0) {
        errors.emplace_back("At least one message required");
    }

    for (size_t i = 0; i < messages.size(); ++i) {
        const auto& message = messages[i];
        std::string prefix = "messages[" + std::to_string(i) + "]";
        if (!JsonUtils::isObject(message)) {
            errors.push_back(prefix + " must be an object");
            continue;
        }

        auto role = JsonUtils::extractOptionalString(message, "role");
        if (!role || role->empty()) {
            errors.push_back(prefix + ": message role required");
        }
        auto content = JsonUtils::extractOptionalString(message, "content");
        if (!content || content->empty()) {
            errors.push_back(prefix + ": message content required");
        }
    }

    return errors;
}

std::vector<std::string> MCPRequestValidator::validateCancelledParams(const crow::json::rvalue& params) {
    std::vector<std::string> errors;

    if (!hasParams(params) || !JsonUtils::isObject(params) || !params.has("requestId")) {
        errors.emplace_back("Cancellation must include 'requestId'");
        return errors;
    }

    auto request_id = params["requestId"];
    if (!JsonUtils::isString(request_id) && !JsonUtils::toInt64(request_id)) {
        errors.emplace_back("requestId must be a string or an integer");
    }

    return errors;
}

Result<SamplingRequest> MCPRequestValidator::parseSamplingRequest(const crow::json::rvalue& params) {
    auto errors = validateSamplingParams(params);
    if (!errors.empty()) {
        return Error::Protocol(constants::INVALID_PARAMS, "Invalid params", errors.front());
    }

    SamplingRequest request;
    request.model = JsonUtils::extractString(params["model"]);
    request.max_tokens = *JsonUtils::extractInt(params, "maxTokens");
    request.system = JsonUtils::extractOptionalString(params, "system");

    const auto& messages = params["messages"];
    for (size_t i = 0; i < messages.size(); ++i) {
        request.messages.push_back(SamplingMessage{
            JsonUtils::extractString(messages[i]["role"]),
            JsonUtils::extractString(messages[i]["content"])});
    }

    return request;
}

bool MCPRequestValidator::validateContentType(const std::string& content_type) {
    // Accept "application/json; charset=utf-8" as well
    return content_type.rfind(constants::CONTENT_TYPE_JSON, 0) == 0;
}

bool MCPRequestValidator::isValidJsonRpcVersion(const std::string& version) {
    return version == constants::JSONRPC_VERSION;
}

bool MCPRequestValidator::hasParams(const crow::json::rvalue& params) {
    return params && params.t() != crow::json::type::Null;
}

void MCPRequestValidator::requireObjectOrAbsent(const crow::json::rvalue& params, const std::string& method,
                                                std::vector<std::string>& errors) {
    if (hasParams(params) && !JsonUtils::isObject(params)) {
        errors.push_back(method + " params must be an object");
    }
}

} // namespace toolhost
