#include "protocol_codec.hpp"
#include "json_utils.hpp"
#include "mcp_constants.hpp"
#include "mcp_error_builder.hpp"
#include "mcp_request_validator.hpp"

namespace toolhost {

namespace constants = toolhost::mcp::constants;

Expected<MCPRequest, DecodeFailure> ProtocolCodec::decodeRequest(const std::string& line) {
    auto message = crow::json::load(line);
    if (!message) {
        return DecodeFailure{MCPErrorBuilder::parseError("Invalid JSON"), std::nullopt};
    }

    if (message.t() == crow::json::type::List) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("Batch requests are not supported"), std::nullopt};
    }
    if (message.t() != crow::json::type::Object) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("Request must be a JSON object"), std::nullopt};
    }

    MCPRequest request;
    if (!extractId(message, request.id)) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("id must be a string, an integer or null"), std::nullopt};
    }

    if (!hasValidVersion(message)) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("jsonrpc must be \"2.0\""), request.id};
    }

    auto method = JsonUtils::extractOptionalString(message, "method");
    if (!method || method->empty()) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("method must be a non-empty string"), request.id};
    }
    request.method = *method;

    if (message.has("params")) {
        auto params = message["params"];
        auto type = params.t();
        if (type != crow::json::type::Object && type != crow::json::type::List &&
            type != crow::json::type::Null) {
            return DecodeFailure{MCPErrorBuilder::invalidRequest("params must be an object or an array"), request.id};
        }
        if (type != crow::json::type::Null) {
            request.params = JsonUtils::clone(params);
        }
    }

    return std::move(request);
}

Expected<MCPResponse, DecodeFailure> ProtocolCodec::decodeResponse(const std::string& line) {
    auto message = crow::json::load(line);
    if (!message) {
        return DecodeFailure{MCPErrorBuilder::parseError("Invalid JSON"), std::nullopt};
    }
    if (message.t() != crow::json::type::Object) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("Response must be a JSON object"), std::nullopt};
    }

    MCPResponse response;
    if (!extractId(message, response.id)) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("id must be a string, an integer or null"), std::nullopt};
    }
    if (!hasValidVersion(message)) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("jsonrpc must be \"2.0\""), response.id};
    }

    bool has_result = message.has("result");
    bool has_error = message.has("error");
    if (has_result == has_error) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("Response must carry exactly one of result or error"),
                             response.id};
    }

    if (has_result) {
        response.result = crow::json::wvalue(message["result"]);
        return std::move(response);
    }

    auto error = message["error"];
    auto code = JsonUtils::extractInt(error, "code");
    auto error_message = JsonUtils::extractOptionalString(error, "message");
    if (!code || !error_message) {
        return DecodeFailure{MCPErrorBuilder::invalidRequest("error must have an integer code and a string message"),
                             response.id};
    }

    MCPError decoded(static_cast<int>(*code), *error_message);
    if (error.has("data")) {
        decoded.data = crow::json::wvalue(error["data"]);
    }
    response.error = std::move(decoded);
    return std::move(response);
}

std::string ProtocolCodec::encodeResponse(const MCPResponse& response) {
    return responseToJson(response).dump();
}

std::string ProtocolCodec::encodeRequest(const MCPRequest& request) {
    crow::json::wvalue request_json;
    request_json["jsonrpc"] = constants::JSONRPC_VERSION;
    if (request.id) {
        request_json["id"] = requestIdToJson(*request.id);
    }
    request_json["method"] = request.method;
    if (request.hasParams()) {
        request_json["params"] = crow::json::wvalue(request.params);
    }
    return request_json.dump();
}

crow::json::wvalue ProtocolCodec::responseToJson(const MCPResponse& response) {
    crow::json::wvalue response_json;
    response_json["jsonrpc"] = constants::JSONRPC_VERSION;

    if (response.id) {
        response_json["id"] = requestIdToJson(*response.id);
    }

    if (response.error) {
        response_json["error"] = errorToJson(*response.error);
    } else if (response.result) {
        response_json["result"] = crow::json::wvalue(*response.result);
    } else {
        response_json["result"] = nullptr;
    }

    return response_json;
}

crow::json::wvalue ProtocolCodec::errorToJson(const MCPError& error) {
    crow::json::wvalue error_json;
    error_json["code"] = error.code;
    error_json["message"] = error.message;

    if (error.data && error.data->t() != crow::json::type::Null) {
        error_json["data"] = crow::json::wvalue(*error.data);
    }

    return error_json;
}

MCPResponse ProtocolCodec::failureResponse(const DecodeFailure& failure) {
    return MCPResponse::failure(failure.id, failure.error);
}

bool ProtocolCodec::extractId(const crow::json::rvalue& message, std::optional<RequestId>& id) {
    id.reset();
    if (!message.has("id")) {
        return true;
    }

    auto id_value = message["id"];
    switch (id_value.t()) {
        case crow::json::type::Null:
            return true;
        case crow::json::type::String:
            id = RequestId(JsonUtils::extractString(id_value));
            return true;
        case crow::json::type::Number: {
            auto number = JsonUtils::toInt64(id_value);
            if (!number) {
                return false;
            }
            id = RequestId(*number);
            return true;
        }
        default:
            return false;
    }
}

bool ProtocolCodec::hasValidVersion(const crow::json::rvalue& message) {
    auto version = JsonUtils::extractOptionalString(message, "jsonrpc");
    return version && MCPRequestValidator::isValidJsonRpcVersion(*version);
}

} // namespace toolhost
