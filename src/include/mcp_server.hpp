#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "config_manager.hpp"
#include "dispatcher.hpp"
#include "resource_provider.hpp"
#include "schema_validator.hpp"
#include "tool_metrics.hpp"
#include "tool_registry.hpp"

namespace toolhost {

/**
 * Owns the registry, the schema validator, the metrics and the dispatcher,
 * and keeps registry and validator in step when tools are added.
 *
 * Transports only need dispatcher(); everything else is exposed for
 * embedding and tests.
 */
class McpServer {
public:
    explicit McpServer(MCPServerInfo server_info);
    ~McpServer() = default;

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Enabled built-in tools, static resources from the config file
    static std::unique_ptr<McpServer> fromConfig(const ConfigManager& config_manager);

    // Compile the schema, then register; a duplicate name leaves the first tool and schema in place
    Status registerTool(std::shared_ptr<UnaryTool> tool);
    Status registerStreamingTool(std::shared_ptr<StreamingTool> tool);

    Status loadBuiltinTools(const ToolsConfig& tools_config);

    void setResourceProvider(std::shared_ptr<ResourceProvider> provider);
    void setSamplingBackend(std::shared_ptr<SamplingBackend> backend);

    const Dispatcher& dispatcher() const { return dispatcher_; }
    std::shared_ptr<ToolRegistry> registry() const { return registry_; }
    std::shared_ptr<SchemaValidator> validator() const { return validator_; }
    std::shared_ptr<ToolMetricsRegistry> metrics() const { return metrics_; }
    const MCPServerInfo& serverInfo() const { return dispatcher_.serverInfo(); }

private:
    template<typename ToolT>
    Status registerEntry(const std::shared_ptr<ToolT>& tool);

    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<SchemaValidator> validator_;
    std::shared_ptr<ToolMetricsRegistry> metrics_;
    Dispatcher dispatcher_;
    std::mutex registration_mutex_;
};

} // namespace toolhost
