#include "config_manager.hpp"
#include "config_loader.hpp"
#include "mcp_client_capabilities.hpp"
#include "mcp_constants.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <crow/logging.h>

namespace toolhost {

bool ToolsConfig::isEnabled(const std::string& name) const {
    return std::find(enabled.begin(), enabled.end(), name) != enabled.end();
}

const std::vector<std::string>& ConfigManager::builtinToolNames() {
    static const std::vector<std::string> names = {"echo", "tail"};
    return names;
}

ConfigManager::ConfigManager() {
    config_.server.name = mcp::constants::SERVER_NAME;
    config_.server.version = mcp::constants::SERVER_VERSION;
    config_.server.protocol_version = mcp::constants::MCP_DEFAULT_PROTOCOL_VERSION;
    config_.worker_threads = WorkerPool::defaultThreadCount();
    config_.tools.enabled = builtinToolNames();
}

ConfigManager::ConfigManager(const std::filesystem::path& config_file)
    : ConfigManager() {
    config_file_ = config_file;
}

void ConfigManager::loadConfig() {
    if (config_file_.empty()) {
        return;
    }

    std::error_code ec;
    if (!std::filesystem::exists(config_file_, ec)) {
        CROW_LOG_INFO << "Configuration file " << config_file_.string() << " not found, using defaults";
        return;
    }

    CROW_LOG_INFO << "Loading configuration file: " << config_file_.string();
    ConfigLoader loader(config_file_);
    YAML::Node root;
    try {
        root = loader.loadYamlFile(loader.getConfigFilePath());
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }

    parseMainConfig(root, loader.getBasePath());
    loaded_from_file_ = true;
    CROW_LOG_INFO << "Configuration loaded successfully";
}

void ConfigManager::loadFromString(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Failed to parse YAML: ") + e.what());
    }
    parseMainConfig(root, std::filesystem::current_path());
}

void ConfigManager::parseMainConfig(const YAML::Node& root, const std::filesystem::path& base_path) {
    // An empty document is a valid, all-defaults config
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("Top-level document must be a mapping");
    }

    parseServerConfig(root["server"]);
    parseTransportConfig(root["transport"]);
    parseWorkersConfig(root["workers"]);
    parseLoggingConfig(root["logging"]);
    parseToolsConfig(root["tools"], base_path);
    parseResources(root["resources"]);
    parseSamplingConfig(root["sampling"]);

    validateConfig();

    CROW_LOG_DEBUG << "Server: " << config_.server.name << " " << config_.server.version
                   << " (protocol " << config_.server.protocol_version << ")";
    CROW_LOG_DEBUG << "Transport: " << config_.transport.type << ", port " << config_.transport.port;
    CROW_LOG_DEBUG << "Worker threads: " << config_.worker_threads;
}

void ConfigManager::parseServerConfig(const YAML::Node& node) {
    if (!node) {
        return;
    }
    config_.server.name = safeGet<std::string>(node, "name", "server.name", config_.server.name);
    config_.server.version = safeGet<std::string>(node, "version", "server.version", config_.server.version);
    config_.server.protocol_version = safeGet<std::string>(
        node, "protocol-version", "server.protocol-version", config_.server.protocol_version);

    if (!MCPClientCapabilitiesDetector::isSupportedProtocolVersion(config_.server.protocol_version)) {
        throw ConfigurationError("Unsupported protocol version: " + config_.server.protocol_version,
                                 "server.protocol-version");
    }
}

void ConfigManager::parseTransportConfig(const YAML::Node& node) {
    if (!node) {
        return;
    }
    config_.transport.type = safeGet<std::string>(node, "type", "transport.type", config_.transport.type);
    config_.transport.port = safeGet<int>(node, "port", "transport.port", config_.transport.port);

    auto max_stream_bytes = safeGet<int64_t>(node, "max-stream-bytes", "transport.max-stream-bytes",
                                             static_cast<int64_t>(config_.transport.max_stream_bytes));
    if (max_stream_bytes < 1) {
        throw ConfigurationError("max-stream-bytes must be at least 1", "transport.max-stream-bytes");
    }
    config_.transport.max_stream_bytes = static_cast<size_t>(max_stream_bytes);
}

void ConfigManager::parseWorkersConfig(const YAML::Node& node) {
    if (!node) {
        return;
    }
    int threads = safeGet<int>(node, "threads", "workers.threads", static_cast<int>(config_.worker_threads));
    if (threads < 1) {
        throw ConfigurationError("Thread count must be at least 1", "workers.threads");
    }
    config_.worker_threads = static_cast<size_t>(threads);
}

void ConfigManager::parseLoggingConfig(const YAML::Node& node) {
    if (!node) {
        return;
    }
    config_.log_level = safeGet<std::string>(node, "level", "logging.level", config_.log_level);
}

void ConfigManager::parseToolsConfig(const YAML::Node& node, const std::filesystem::path& base_path) {
    if (!node) {
        return;
    }

    if (node["enabled"]) {
        auto enabled = safeGet<std::vector<std::string>>(node, "enabled", "tools.enabled");
        for (const auto& name : enabled) {
            const auto& known = builtinToolNames();
            if (std::find(known.begin(), known.end(), name) == known.end()) {
                throw ConfigurationError("Unknown built-in tool: " + name, "tools.enabled");
            }
        }
        config_.tools.enabled = std::move(enabled);
    }

    auto tail = node["tail"];
    if (tail) {
        config_.tools.tail.max_lines =
            safeGet<int>(tail, "max-lines", "tools.tail.max-lines", config_.tools.tail.max_lines);
        if (config_.tools.tail.max_lines < 1) {
            throw ConfigurationError("max-lines must be at least 1", "tools.tail.max-lines");
        }
        if (tail["root"]) {
            std::filesystem::path root = safeGet<std::string>(tail, "root", "tools.tail.root");
            if (root.is_relative()) {
                root = base_path / root;
            }
            config_.tools.tail.root = root.lexically_normal();
            CROW_LOG_DEBUG << "Tail tool confined to " << config_.tools.tail.root->string();
        }
    }
}

void ConfigManager::parseResources(const YAML::Node& node) {
    if (!node) {
        return;
    }
    if (!node.IsSequence()) {
        throw ConfigurationError("resources must be a list", "resources");
    }

    config_.resources.clear();
    for (size_t i = 0; i < node.size(); ++i) {
        std::string path = "resources[" + std::to_string(i) + "]";
        const auto& entry = node[i];
        if (!entry.IsMap()) {
            throw ConfigurationError("resource entry must be a mapping", path);
        }

        ResourceDescriptor resource;
        resource.uri = safeGet<std::string>(entry, "uri", path + ".uri");
        resource.name = safeGet<std::string>(entry, "name", path + ".name");
        resource.description = safeGet<std::string>(entry, "description", path + ".description", "");
        resource.mime_type = safeGet<std::string>(entry, "mime-type", path + ".mime-type", "text/plain");
        if (resource.uri.empty()) {
            throw ConfigurationError("uri must not be empty", path + ".uri");
        }
        config_.resources.push_back(std::move(resource));
    }
    CROW_LOG_DEBUG << "Configured " << config_.resources.size() << " resource(s)";
}

void ConfigManager::parseSamplingConfig(const YAML::Node& node) {
    if (!node) {
        return;
    }
    config_.sampling_enabled = safeGet<bool>(node, "enabled", "sampling.enabled", false);
    if (config_.sampling_enabled) {
        CROW_LOG_WARNING << "sampling.enabled is set but no sampling backend is built in";
    }
}

void ConfigManager::setPort(int port) {
    config_.transport.port = port;
}

void ConfigManager::setTransportType(const std::string& type) {
    config_.transport.type = type;
}

void ConfigManager::setLogLevel(const std::string& level) {
    config_.log_level = level;
}

void ConfigManager::validateConfig() const {
    const auto& transport = config_.transport;
    if (transport.type != "stdio" && transport.type != "http") {
        throw ConfigurationError("Unknown transport type '" + transport.type + "', expected stdio or http",
                                 "transport.type");
    }
    if (transport.port < 1 || transport.port > 65535) {
        throw ConfigurationError("Port must be between 1 and 65535, got " + std::to_string(transport.port),
                                 "transport.port");
    }
    if (config_.worker_threads < 1) {
        throw ConfigurationError("Thread count must be at least 1", "workers.threads");
    }
    if (!isValidLogLevel(config_.log_level)) {
        throw ConfigurationError("Unknown log level '" + config_.log_level +
                                 "', expected debug, info, warning or error", "logging.level");
    }
}

MCPServerInfo ConfigManager::getServerInfo() const {
    MCPServerInfo info;
    info.name = config_.server.name;
    info.version = config_.server.version;
    info.protocol_version = config_.server.protocol_version;
    return info;
}

bool ConfigManager::isValidLogLevel(const std::string& level) {
    return level == "debug" || level == "info" || level == "warning" || level == "error";
}

template<typename T>
T ConfigManager::safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const {
    if (!node[key]) {
        return defaultValue;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), path);
    }
}

template<typename T>
T ConfigManager::safeGet(const YAML::Node& node, const std::string& key, const std::string& path) const {
    if (!node[key]) {
        throw ConfigurationError("Missing required key: " + key, path);
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), path);
    }
}

} // namespace toolhost
