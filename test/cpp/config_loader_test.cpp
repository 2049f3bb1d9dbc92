#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "config_loader.hpp"
#include "test_utils.hpp"

using namespace toolhost;
using namespace toolhost::test;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ConfigLoader: path handling", "[config]") {
    TempDirectory dir("loader_test");
    auto config = dir.writeFile("toolhost.yaml", "server:\n  name: demo\n");
    dir.createSubdir("data");
    ConfigLoader loader(config);

    REQUIRE(loader.getConfigFilePath() == std::filesystem::absolute(config));
    REQUIRE(loader.getBasePath() == std::filesystem::absolute(config).parent_path());

    SECTION("Relative paths are anchored at the config directory") {
        REQUIRE(loader.resolvePath("toolhost.yaml") == std::filesystem::canonical(config));
        REQUIRE(loader.resolvePath("later/created.yaml") == loader.getBasePath() / "later/created.yaml");
        REQUIRE(loader.resolvePath("") == loader.getBasePath());
        REQUIRE(loader.resolvePath("/etc/hosts") == "/etc/hosts");
    }

    SECTION("Existence checks") {
        REQUIRE(loader.fileExists("toolhost.yaml"));
        REQUIRE_FALSE(loader.fileExists("data"));
        REQUIRE(loader.directoryExists("data"));
        REQUIRE_FALSE(loader.directoryExists("missing"));
    }

    SECTION("Reading files") {
        REQUIRE(loader.readFile("toolhost.yaml") == "server:\n  name: demo\n");
        REQUIRE_THROWS_WITH(loader.readFile("missing.yaml"), ContainsSubstring("Cannot open file"));
    }
}

TEST_CASE("ConfigLoader: YAML loading", "[config]") {
    TempDirectory dir("loader_yaml");
    auto config = dir.writeFile("toolhost.yaml", "transport:\n  type: http\n  port: 9000\n");
    dir.writeFile("broken.yaml", "server: [unclosed\n");
    ConfigLoader loader(config);

    auto root = loader.loadYamlFile("toolhost.yaml");
    REQUIRE(root["transport"]["type"].as<std::string>() == "http");
    REQUIRE(root["transport"]["port"].as<int>() == 9000);

    REQUIRE_THROWS_WITH(loader.loadYamlFile("absent.yaml"), ContainsSubstring("Configuration file not found"));
    REQUIRE_THROWS_WITH(loader.loadYamlFile("broken.yaml"), ContainsSubstring("Failed to parse YAML file"));
}
