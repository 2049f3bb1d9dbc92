#pragma once

#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "mcp_constants.hpp"
#include "mcp_types.hpp"

namespace toolhost {

struct ServerConfig {
    std::string name;
    std::string version;
    std::string protocol_version;
};

struct TransportConfig {
    std::string type = "stdio";
    int port = 8080;
    // HTTP only; a streaming call that outgrows this is cut off with an error frame
    size_t max_stream_bytes = mcp::constants::DEFAULT_MAX_STREAM_RESPONSE_BYTES;

    bool isHttp() const { return type == "http"; }
};

struct TailToolConfig {
    int max_lines = 1000;
    // Files outside this directory are refused when set
    std::optional<std::filesystem::path> root;
};

struct ToolsConfig {
    std::vector<std::string> enabled;
    TailToolConfig tail;

    bool isEnabled(const std::string& name) const;
};

struct ToolhostConfig {
    ServerConfig server;
    TransportConfig transport;
    size_t worker_threads = 2;
    std::string log_level = "info";
    ToolsConfig tools;
    std::vector<ResourceDescriptor> resources;
    bool sampling_enabled = false;
};

class ConfigManager {
public:
    static const std::vector<std::string>& builtinToolNames();

    // Built-in defaults; no file is read
    ConfigManager();
    explicit ConfigManager(const std::filesystem::path& config_file);

    // A missing file keeps the defaults; an unreadable or invalid one throws ConfigurationError
    void loadConfig();
    void loadFromString(const std::string& yaml_content);

    // Command line overrides, applied after loadConfig()
    void setPort(int port);
    void setTransportType(const std::string& type);
    void setLogLevel(const std::string& level);

    // Re-checks the combined file + CLI values
    void validateConfig() const;

    const ToolhostConfig& getConfig() const { return config_; }
    const std::filesystem::path& getConfigFile() const { return config_file_; }
    bool isLoadedFromFile() const { return loaded_from_file_; }

    MCPServerInfo getServerInfo() const;

    static bool isValidLogLevel(const std::string& level);

private:
    void parseMainConfig(const YAML::Node& root, const std::filesystem::path& base_path);
    void parseServerConfig(const YAML::Node& node);
    void parseTransportConfig(const YAML::Node& node);
    void parseWorkersConfig(const YAML::Node& node);
    void parseLoggingConfig(const YAML::Node& node);
    void parseToolsConfig(const YAML::Node& node, const std::filesystem::path& base_path);
    void parseResources(const YAML::Node& node);
    void parseSamplingConfig(const YAML::Node& node);

    template<typename T>
    T safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const;

    template<typename T>
    T safeGet(const YAML::Node& node, const std::string& key, const std::string& path) const;

    std::filesystem::path config_file_;
    bool loaded_from_file_ = false;
    ToolhostConfig config_;
};

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message, const std::string& yamlPath = "")
        : std::runtime_error(formatMessage(message, yamlPath)) {}

private:
    static std::string formatMessage(const std::string& message, const std::string& yamlPath) {
        std::ostringstream oss;
        oss << "Configuration error";
        if (!yamlPath.empty()) {
            oss << " at " << yamlPath;
        }
        oss << ": " << message;
        return oss.str();
    }
};

} // namespace toolhost
