#pragma once

#include "error.hpp"
#include "tool.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace toolhost {

// A registered implementation: exactly one of the two shapes
using ToolEntry = std::variant<std::shared_ptr<UnaryTool>, std::shared_ptr<StreamingTool>>;

/**
 * Concurrent name -> tool store.
 *
 * One map holds both shapes, so a name can never be unary and streaming at the
 * same time. Lookups share the lock; registration and removal take it
 * exclusively. The lock is released before a resolved tool executes.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Duplicate names are rejected and the existing entry is kept
    Status registerTool(const std::string& name, std::shared_ptr<UnaryTool> tool);
    Status registerStreamingTool(const std::string& name, std::shared_ptr<StreamingTool> tool);

    // Not-found when absent or registered under the other shape
    Result<std::shared_ptr<UnaryTool>> getTool(const std::string& name) const;
    Result<std::shared_ptr<StreamingTool>> getStreamingTool(const std::string& name) const;
    Result<ToolEntry> resolve(const std::string& name) const;

    Result<ToolResponse> execute(const std::string& name, const crow::json::rvalue& args) const;
    Result<std::unique_ptr<ChunkStream>> executeStreaming(const std::string& name,
                                                          const crow::json::rvalue& args) const;

    std::vector<ToolMetadata> listTools() const;
    bool hasTool(const std::string& name) const;
    bool isStreaming(const std::string& name) const;

    // Missing names are a no-op
    void unregisterTool(const std::string& name);
    void clear();
    size_t toolCount() const;

private:
    Status insert(const std::string& name, ToolEntry entry);
    static Error notFound(const std::string& name);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ToolEntry> tools_;
};

} // namespace toolhost
