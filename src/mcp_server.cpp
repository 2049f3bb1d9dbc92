#include "mcp_server.hpp"
#include "builtin_tools.hpp"
#include <crow/logging.h>
#include <type_traits>

namespace toolhost {

McpServer::McpServer(MCPServerInfo server_info)
    : registry_(std::make_shared<ToolRegistry>()),
      validator_(std::make_shared<SchemaValidator>()),
      metrics_(std::make_shared<ToolMetricsRegistry>()),
      dispatcher_(registry_, validator_, metrics_, std::move(server_info)) {
    CROW_LOG_INFO << "MCP server " << dispatcher_.serverInfo().name << " " << dispatcher_.serverInfo().version
                  << " created (protocol " << dispatcher_.serverInfo().protocol_version << ")";
}

std::unique_ptr<McpServer> McpServer::fromConfig(const ConfigManager& config_manager) {
    const auto& config = config_manager.getConfig();
    auto server = std::make_unique<McpServer>(config_manager.getServerInfo());

    auto loaded = server->loadBuiltinTools(config.tools);
    if (!loaded) {
        throw ConfigurationError(loaded.error().describe(), "tools");
    }

    if (!config.resources.empty()) {
        server->setResourceProvider(std::make_shared<StaticResourceProvider>(config.resources));
    }

    CROW_LOG_INFO << "MCP server ready with " << server->registry()->toolCount() << " tool(s)";
    return server;
}

template<typename ToolT>
Status McpServer::registerEntry(const std::shared_ptr<ToolT>& tool) {
    if (!tool) {
        return Error::Internal("Cannot register a null tool");
    }

    auto metadata = tool->metadata();
    const std::string& name = metadata.name;

    // Serializes the check-compile-insert sequence across registrations
    std::lock_guard<std::mutex> lock(registration_mutex_);
    if (registry_->hasTool(name)) {
        return Error::Validation("Tool already registered", {}, name);
    }

    auto compiled = validator_->registerSchema(name, metadata.input_schema);
    if (!compiled) {
        CROW_LOG_ERROR << "Schema for tool '" << name << "' does not compile: " << compiled.error().describe();
        return std::move(compiled.error());
    }

    Status registered;
    if constexpr (std::is_same_v<ToolT, UnaryTool>) {
        registered = registry_->registerTool(name, tool);
    } else {
        registered = registry_->registerStreamingTool(name, tool);
    }

    if (!registered) {
        validator_->removeSchema(name);
    }
    return registered;
}

Status McpServer::registerTool(std::shared_ptr<UnaryTool> tool) {
    return registerEntry(tool);
}

Status McpServer::registerStreamingTool(std::shared_ptr<StreamingTool> tool) {
    return registerEntry(tool);
}

Status McpServer::loadBuiltinTools(const ToolsConfig& tools_config) {
    if (tools_config.isEnabled("echo")) {
        auto status = registerTool(makeEchoTool());
        if (!status) {
            return status;
        }
    }
    if (tools_config.isEnabled("tail")) {
        auto status = registerStreamingTool(std::make_shared<TailTool>(tools_config.tail));
        if (!status) {
            return status;
        }
    }
    return Status();
}

void McpServer::setResourceProvider(std::shared_ptr<ResourceProvider> provider) {
    dispatcher_.setResourceProvider(std::move(provider));
}

void McpServer::setSamplingBackend(std::shared_ptr<SamplingBackend> backend) {
    dispatcher_.setSamplingBackend(std::move(backend));
}

} // namespace toolhost
