#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "config_manager.hpp"
#include "test_utils.hpp"

using namespace toolhost;
using namespace toolhost::test;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ConfigManager: defaults", "[config]") {
    ConfigManager manager;
    const auto& config = manager.getConfig();

    REQUIRE(config.server.name == "toolhost");
    REQUIRE(config.server.version == "0.1.0");
    REQUIRE(config.server.protocol_version == "2024-11-05");
    REQUIRE(config.transport.type == "stdio");
    REQUIRE_FALSE(config.transport.isHttp());
    REQUIRE(config.transport.port == 8080);
    REQUIRE(config.transport.max_stream_bytes == 8 * 1024 * 1024);
    REQUIRE(config.worker_threads >= 2);
    REQUIRE(config.log_level == "info");
    REQUIRE(config.tools.isEnabled("echo"));
    REQUIRE(config.tools.isEnabled("tail"));
    REQUIRE(config.tools.tail.max_lines == 1000);
    REQUIRE_FALSE(config.tools.tail.root);
    REQUIRE(config.resources.empty());
    REQUIRE_FALSE(config.sampling_enabled);
    REQUIRE_FALSE(manager.isLoadedFromFile());
    REQUIRE_NOTHROW(manager.validateConfig());

    auto info = manager.getServerInfo();
    REQUIRE(info.name == "toolhost");
    REQUIRE(info.protocol_version == "2024-11-05");
}

TEST_CASE("ConfigManager: full document", "[config]") {
    ConfigManager manager;
    manager.loadFromString(R"(
server:
  name: log-host
  version: 2.0.0
  protocol-version: 2025-03-26
transport:
  type: http
  port: 9090
  max-stream-bytes: 65536
workers:
  threads: 6
logging:
  level: debug
tools:
  enabled: [tail]
  tail:
    max-lines: 200
    root: /var/log
resources:
  - uri: file:///var/log/syslog
    name: syslog
    description: System log
  - uri: file:///var/log/app.json
    name: app
    mime-type: application/json
sampling:
  enabled: true
)");

    const auto& config = manager.getConfig();
    REQUIRE(config.server.name == "log-host");
    REQUIRE(config.server.version == "2.0.0");
    REQUIRE(config.server.protocol_version == "2025-03-26");
    REQUIRE(config.transport.isHttp());
    REQUIRE(config.transport.port == 9090);
    REQUIRE(config.transport.max_stream_bytes == 65536);
    REQUIRE(config.worker_threads == 6);
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.tools.enabled == std::vector<std::string>{"tail"});
    REQUIRE_FALSE(config.tools.isEnabled("echo"));
    REQUIRE(config.tools.tail.max_lines == 200);
    REQUIRE(config.tools.tail.root == std::filesystem::path("/var/log"));
    REQUIRE(config.sampling_enabled);

    REQUIRE(config.resources.size() == 2);
    REQUIRE(config.resources[0].description == "System log");
    REQUIRE(config.resources[0].mime_type == "text/plain");
    REQUIRE(config.resources[1].mime_type == "application/json");
    REQUIRE(config.resources[1].description.empty());
}

TEST_CASE("ConfigManager: rejected values", "[config]") {
    ConfigManager manager;

    SECTION("Transport type") {
        REQUIRE_THROWS_WITH(manager.loadFromString("transport:\n  type: websocket\n"),
                            ContainsSubstring("Unknown transport type 'websocket'"));
    }

    SECTION("Port range") {
        REQUIRE_THROWS_WITH(manager.loadFromString("transport:\n  port: 70000\n"),
                            ContainsSubstring("Port must be between 1 and 65535, got 70000"));
    }

    SECTION("Stream response limit") {
        REQUIRE_THROWS_WITH(manager.loadFromString("transport:\n  max-stream-bytes: 0\n"),
                            ContainsSubstring("max-stream-bytes must be at least 1"));
    }

    SECTION("Port type") {
        REQUIRE_THROWS_AS(manager.loadFromString("transport:\n  port: eighty\n"), ConfigurationError);
    }

    SECTION("Log level") {
        REQUIRE_THROWS_WITH(manager.loadFromString("logging:\n  level: loud\n"),
                            ContainsSubstring("Configuration error at logging.level"));
    }

    SECTION("Unknown tool") {
        REQUIRE_THROWS_WITH(manager.loadFromString("tools:\n  enabled: [echo, rm]\n"),
                            ContainsSubstring("Unknown built-in tool: rm"));
    }

    SECTION("Tail line limit") {
        REQUIRE_THROWS_AS(manager.loadFromString("tools:\n  tail:\n    max-lines: 0\n"), ConfigurationError);
    }

    SECTION("Worker threads") {
        REQUIRE_THROWS_AS(manager.loadFromString("workers:\n  threads: 0\n"), ConfigurationError);
    }

    SECTION("Protocol version") {
        REQUIRE_THROWS_WITH(manager.loadFromString("server:\n  protocol-version: 1999-01-01\n"),
                            ContainsSubstring("Unsupported protocol version"));
    }

    SECTION("Resource without uri") {
        REQUIRE_THROWS_WITH(manager.loadFromString("resources:\n  - name: nameless\n"),
                            ContainsSubstring("resources[0].uri"));
    }

    SECTION("Malformed YAML") {
        REQUIRE_THROWS_AS(manager.loadFromString("server: [unclosed"), ConfigurationError);
    }

    SECTION("Not a mapping") {
        REQUIRE_THROWS_AS(manager.loadFromString("- just\n- a list\n"), ConfigurationError);
    }
}

TEST_CASE("ConfigManager: command line overrides", "[config]") {
    ConfigManager manager;
    manager.loadFromString("transport:\n  type: stdio\n");

    manager.setTransportType("http");
    manager.setPort(3000);
    manager.setLogLevel("warning");
    REQUIRE_NOTHROW(manager.validateConfig());
    REQUIRE(manager.getConfig().transport.port == 3000);

    manager.setPort(0);
    REQUIRE_THROWS_AS(manager.validateConfig(), ConfigurationError);

    manager.setPort(3000);
    manager.setLogLevel("verbose");
    REQUIRE_THROWS_AS(manager.validateConfig(), ConfigurationError);

    REQUIRE(ConfigManager::isValidLogLevel("error"));
    REQUIRE_FALSE(ConfigManager::isValidLogLevel("trace"));
}

TEST_CASE("ConfigManager: loading from a file", "[config]") {
    SECTION("A missing file keeps the defaults") {
        ConfigManager manager("/nonexistent/toolhost.yaml");
        REQUIRE_NOTHROW(manager.loadConfig());
        REQUIRE_FALSE(manager.isLoadedFromFile());
        REQUIRE(manager.getConfig().server.name == "toolhost");
    }

    SECTION("Relative tail root resolves against the config directory") {
        TempDirectory dir("config_file");
        auto file = dir.writeFile("toolhost.yaml", "tools:\n  tail:\n    root: logs/../logs\n");
        ConfigManager manager(file);
        manager.loadConfig();

        REQUIRE(manager.isLoadedFromFile());
        REQUIRE(manager.getConfigFile() == file);
        auto expected = (std::filesystem::absolute(file).parent_path() / "logs").lexically_normal();
        REQUIRE(manager.getConfig().tools.tail.root == expected);
    }

    SECTION("An invalid file throws") {
        TempFile file("transport:\n  port: -1\n", "toolhost.yaml");
        ConfigManager manager(file.fsPath());
        REQUIRE_THROWS_AS(manager.loadConfig(), ConfigurationError);
    }

    SECTION("An empty file is all defaults") {
        TempFile file("", "toolhost.yaml");
        ConfigManager manager(file.fsPath());
        REQUIRE_NOTHROW(manager.loadConfig());
        REQUIRE(manager.isLoadedFromFile());
        REQUIRE(manager.getConfig().transport.port == 8080);
    }
}
