#include <catch2/catch_test_macros.hpp>
#include "mcp_constants.hpp"
#include "mcp_error_builder.hpp"
#include "protocol_codec.hpp"

using namespace toolhost;
namespace constants = toolhost::mcp::constants;

TEST_CASE("ProtocolCodec: decode valid requests", "[codec]") {
    SECTION("Integer id with params") {
        auto decoded = ProtocolCodec::decodeRequest(
            R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
        REQUIRE(decoded);
        const auto& request = decoded.value();
        REQUIRE(request.method == "tools/call");
        REQUIRE(request.id.has_value());
        REQUIRE(std::get<int64_t>(*request.id) == 1);
        REQUIRE_FALSE(request.isNotification());
        REQUIRE(request.hasParams());
        REQUIRE(std::string(request.params["name"].s()) == "echo");
        REQUIRE(std::string(request.params["arguments"]["message"].s()) == "hi");
    }

    SECTION("String id without params") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":"abc","method":"tools/list"})");
        REQUIRE(decoded);
        REQUIRE(std::get<std::string>(*decoded.value().id) == "abc");
        REQUIRE_FALSE(decoded.value().hasParams());
    }

    SECTION("Large integer ids keep every digit") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":9007199254740993,"method":"ping"})");
        REQUIRE(decoded);
        REQUIRE(std::get<int64_t>(*decoded.value().id) == 9007199254740993LL);

        auto line = ProtocolCodec::encodeResponse(
            MCPResponse::success(decoded.value().id, crow::json::wvalue::object()));
        REQUIRE(line.find("\"id\":9007199254740993") != std::string::npos);

        auto negative =
            ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":-9007199254740993,"method":"ping"})");
        REQUIRE(negative);
        REQUIRE(std::get<int64_t>(*negative.value().id) == -9007199254740993LL);
    }

    SECTION("Any method string is accepted; routing decides if it exists") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":4,"method":"tools-list"})");
        REQUIRE(decoded);
        REQUIRE(decoded.value().method == "tools-list");
    }

    SECTION("Missing id is a notification") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
        REQUIRE(decoded);
        REQUIRE(decoded.value().isNotification());
    }

    SECTION("Null id is a notification") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
        REQUIRE(decoded);
        REQUIRE(decoded.value().isNotification());
    }

    SECTION("Null params count as absent") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":2,"method":"ping","params":null})");
        REQUIRE(decoded);
        REQUIRE_FALSE(decoded.value().hasParams());
    }
}

TEST_CASE("ProtocolCodec: malformed input", "[codec]") {
    SECTION("Unparseable text is a parse error without id") {
        auto decoded = ProtocolCodec::decodeRequest("{not json");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::PARSE_ERROR);
        REQUIRE_FALSE(decoded.error().id.has_value());
    }

    SECTION("Batches are rejected") {
        auto decoded = ProtocolCodec::decodeRequest(R"([{"jsonrpc":"2.0","id":1,"method":"ping"}])");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::INVALID_REQUEST);
    }

    SECTION("Scalars are rejected") {
        auto decoded = ProtocolCodec::decodeRequest("42");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::INVALID_REQUEST);
    }

    SECTION("Wrong version echoes the id") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"1.0","id":7,"method":"ping"})");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::INVALID_REQUEST);
        REQUIRE(decoded.error().id.has_value());
        REQUIRE(std::get<int64_t>(*decoded.error().id) == 7);
    }

    SECTION("Missing version") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"id":7,"method":"ping"})");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::INVALID_REQUEST);
    }

    SECTION("Missing method echoes the id") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":"r1"})");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::INVALID_REQUEST);
        REQUIRE(std::get<std::string>(*decoded.error().id) == "r1");
    }

    SECTION("Method must be a string") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":1,"method":5})");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::INVALID_REQUEST);
    }

    SECTION("Fractional and structured ids are invalid") {
        auto fractional = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})");
        REQUIRE_FALSE(fractional);
        REQUIRE(fractional.error().error.code == constants::INVALID_REQUEST);
        REQUIRE_FALSE(fractional.error().id.has_value());

        auto object_id = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":{},"method":"ping"})");
        REQUIRE_FALSE(object_id);
    }

    SECTION("Integral ids outside the 64-bit range are invalid") {
        auto huge = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":1e300,"method":"ping"})");
        REQUIRE_FALSE(huge);
        REQUIRE(huge.error().error.code == constants::INVALID_REQUEST);

        auto too_many_digits =
            ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":99999999999999999999,"method":"ping"})");
        REQUIRE_FALSE(too_many_digits);
        REQUIRE(too_many_digits.error().error.code == constants::INVALID_REQUEST);
    }

    SECTION("Scalar params are invalid") {
        auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":3})");
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().error.code == constants::INVALID_REQUEST);
    }
}

TEST_CASE("ProtocolCodec: encode responses", "[codec]") {
    SECTION("Success carries result and no error") {
        crow::json::wvalue result;
        result["ok"] = true;
        auto line = ProtocolCodec::encodeResponse(MCPResponse::success(RequestId(int64_t(3)), std::move(result)));

        REQUIRE(line.find('\n') == std::string::npos);
        auto json = crow::json::load(line);
        REQUIRE(std::string(json["jsonrpc"].s()) == "2.0");
        REQUIRE(json["id"].d() == 3);
        REQUIRE(json["result"]["ok"].b());
        REQUIRE_FALSE(json.has("error"));
    }

    SECTION("Failure carries error and no result") {
        auto line = ProtocolCodec::encodeResponse(
            MCPResponse::failure(RequestId(std::string("x")), MCPErrorBuilder::methodNotFound("nope")));
        auto json = crow::json::load(line);
        REQUIRE(std::string(json["id"].s()) == "x");
        REQUIRE(json["error"]["code"].d() == constants::METHOD_NOT_FOUND);
        REQUIRE_FALSE(json.has("result"));
    }

    SECTION("Absent id is omitted") {
        auto line = ProtocolCodec::encodeResponse(
            MCPResponse::failure(std::nullopt, MCPErrorBuilder::parseError("Invalid JSON")));
        auto json = crow::json::load(line);
        REQUIRE_FALSE(json.has("id"));
        REQUIRE(json["error"]["code"].d() == constants::PARSE_ERROR);
    }

    SECTION("Embedded newlines in content stay escaped") {
        crow::json::wvalue result;
        result["text"] = "line one\nline two";
        auto line = ProtocolCodec::encodeResponse(MCPResponse::success(RequestId(int64_t(1)), std::move(result)));
        REQUIRE(line.find('\n') == std::string::npos);
        REQUIRE(std::string(crow::json::load(line)["result"]["text"].s()) == "line one\nline two");
    }
}

TEST_CASE("ProtocolCodec: decode responses", "[codec]") {
    SECTION("Result response") {
        auto decoded = ProtocolCodec::decodeResponse(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})");
        REQUIRE(decoded);
        REQUIRE_FALSE(decoded.value().isError());
        REQUIRE(decoded.value().result.has_value());
    }

    SECTION("Error response") {
        auto decoded = ProtocolCodec::decodeResponse(
            R"({"jsonrpc":"2.0","id":1,"error":{"code":-31001,"message":"Tool not found: x","data":{"category":"NotFound"}}})");
        REQUIRE(decoded);
        REQUIRE(decoded.value().isError());
        REQUIRE(decoded.value().error->code == constants::TOOL_NOT_FOUND);
        REQUIRE(decoded.value().error->data.has_value());
    }

    SECTION("Both result and error is invalid") {
        auto decoded = ProtocolCodec::decodeResponse(
            R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"m"}})");
        REQUIRE_FALSE(decoded);
    }
}

TEST_CASE("ProtocolCodec: request encoding decodes to the same message", "[codec]") {
    auto original = ProtocolCodec::decodeRequest(
        R"({"jsonrpc":"2.0","id":"q","method":"tools/call","params":{"name":"echo"}})");
    REQUIRE(original);

    auto again = ProtocolCodec::decodeRequest(ProtocolCodec::encodeRequest(original.value()));
    REQUIRE(again);
    REQUIRE(again.value().method == "tools/call");
    REQUIRE(std::get<std::string>(*again.value().id) == "q");
    REQUIRE(std::string(again.value().params["name"].s()) == "echo");
}

TEST_CASE("ProtocolCodec: failure response echoes the recovered id", "[codec]") {
    auto decoded = ProtocolCodec::decodeRequest(R"({"jsonrpc":"2.0","id":9,"method":"bad name!"})");
    REQUIRE_FALSE(decoded);

    auto json = crow::json::load(ProtocolCodec::encodeResponse(ProtocolCodec::failureResponse(decoded.error())));
    REQUIRE(json["id"].d() == 9);
    REQUIRE(json["error"]["code"].d() == constants::INVALID_REQUEST);
}
