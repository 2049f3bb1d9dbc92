#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <thread>

#include "mcp_server.hpp"
#include "test_utils.hpp"

using namespace toolhost;
using namespace toolhost::test;

namespace {

MCPServerInfo testInfo() {
    MCPServerInfo info;
    info.name = "server-test";
    info.version = "0.0.1";
    info.protocol_version = "2024-11-05";
    return info;
}

class BadSchemaTool : public UnaryTool {
public:
    ToolMetadata metadata() const override {
        crow::json::wvalue schema;
        schema["type"] = "text";
        return makeMetadata("bad", std::move(schema));
    }

    Result<ToolResponse> execute(const crow::json::rvalue&) const override {
        return ToolResponse::text("unreachable");
    }
};

} // namespace

TEST_CASE("McpServer: registration keeps registry and validator in step", "[server]") {
    McpServer server(testInfo());
    REQUIRE(server.serverInfo().name == "server-test");

    auto first = std::make_shared<CountingTool>("counter", "first");
    REQUIRE(server.registerTool(first));
    REQUIRE(server.registry()->hasTool("counter"));
    REQUIRE(server.validator()->hasSchema("counter"));

    SECTION("Duplicates are rejected and the first tool stays") {
        auto second = std::make_shared<CountingTool>("counter", "second");
        auto status = server.registerTool(second);
        REQUIRE_FALSE(status);
        REQUIRE(status.error().message == "Tool already registered");

        auto result = server.registry()->execute("counter", crow::json::load(R"({"message":"x"})"));
        REQUIRE(result.value().content == "first");
        REQUIRE(server.validator()->validate("counter", crow::json::load("{}")).error().category ==
                ErrorCategory::Validation);
    }

    SECTION("A streaming tool may not reuse the name") {
        auto status = server.registerStreamingTool(
            std::make_shared<ScriptedStreamingTool>("counter", std::vector<std::string>{}));
        REQUIRE_FALSE(status);
        REQUIRE_FALSE(server.registry()->isStreaming("counter"));
    }

    SECTION("A schema that does not compile blocks registration") {
        auto status = server.registerTool(std::make_shared<BadSchemaTool>());
        REQUIRE_FALSE(status);
        REQUIRE(status.error().category == ErrorCategory::Configuration);
        REQUIRE_FALSE(server.registry()->hasTool("bad"));
        REQUIRE_FALSE(server.validator()->hasSchema("bad"));
    }

    SECTION("Null tools are rejected") {
        REQUIRE_FALSE(server.registerTool(nullptr));
    }
}

TEST_CASE("McpServer: concurrent registration of one name", "[server][concurrency]") {
    McpServer server(testInfo());
    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&server, &succeeded, i]() {
            if (server.registerTool(std::make_shared<CountingTool>("shared", std::to_string(i)))) {
                ++succeeded;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(succeeded == 1);
    REQUIRE(server.registry()->toolCount() == 1);
    REQUIRE(server.validator()->schemaCount() == 1);
}

TEST_CASE("McpServer: built from configuration", "[server]") {
    SECTION("Defaults enable echo and tail") {
        ConfigManager config;
        auto server = McpServer::fromConfig(config);
        REQUIRE(server->registry()->hasTool("echo"));
        REQUIRE(server->registry()->isStreaming("tail"));
        REQUIRE_FALSE(server->dispatcher().serverCapabilities().resources);
        REQUIRE(server->serverInfo().name == "toolhost");
    }

    SECTION("Enabled tools and resources come from YAML") {
        ConfigManager config;
        config.loadFromString(R"(
server:
  name: configured
tools:
  enabled: [echo]
resources:
  - uri: file:///tmp/notes.txt
    name: notes
)");
        auto server = McpServer::fromConfig(config);
        REQUIRE(server->serverInfo().name == "configured");
        REQUIRE(server->registry()->toolCount() == 1);
        REQUIRE_FALSE(server->registry()->hasTool("tail"));
        REQUIRE(server->dispatcher().serverCapabilities().resources);
    }

    SECTION("Loading built-ins twice is a configuration problem") {
        ConfigManager config;
        auto server = McpServer::fromConfig(config);
        REQUIRE_FALSE(server->loadBuiltinTools(config.getConfig().tools));
    }
}
