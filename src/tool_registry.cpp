#include "tool_registry.hpp"
#include <algorithm>
#include <crow.h>
#include <mutex>

namespace toolhost {

namespace {

// tools/list shows metadata names and tools/call looks up registry keys, so the two must agree
template<typename ToolT>
Status checkRegistration(const std::string& name, const std::shared_ptr<ToolT>& tool) {
    if (!tool) {
        return Error::Internal("Cannot register a null tool", name);
    }
    auto declared = tool->metadata().name;
    if (declared != name) {
        return Error::Validation("Tool name does not match its metadata", {},
                                 "registered as '" + name + "', metadata says '" + declared + "'");
    }
    return Status();
}

} // namespace

Status ToolRegistry::registerTool(const std::string& name, std::shared_ptr<UnaryTool> tool) {
    auto checked = checkRegistration(name, tool);
    if (!checked) {
        return checked;
    }
    return insert(name, ToolEntry(std::move(tool)));
}

Status ToolRegistry::registerStreamingTool(const std::string& name, std::shared_ptr<StreamingTool> tool) {
    auto checked = checkRegistration(name, tool);
    if (!checked) {
        return checked;
    }
    return insert(name, ToolEntry(std::move(tool)));
}

Status ToolRegistry::insert(const std::string& name, ToolEntry entry) {
    if (name.empty()) {
        return Error::Validation("Tool name must not be empty");
    }

    const bool streaming = std::holds_alternative<std::shared_ptr<StreamingTool>>(entry);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!tools_.emplace(name, std::move(entry)).second) {
            return Error::Validation("Tool already registered", {}, name);
        }
    }

    CROW_LOG_INFO << "Registered " << (streaming ? "streaming" : "unary") << " tool: " << name;
    return Status();
}

Result<std::shared_ptr<UnaryTool>> ToolRegistry::getTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return notFound(name);
    }

    const auto* tool = std::get_if<std::shared_ptr<UnaryTool>>(&it->second);
    if (!tool) {
        return notFound(name);
    }
    return *tool;
}

Result<std::shared_ptr<StreamingTool>> ToolRegistry::getStreamingTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return notFound(name);
    }

    const auto* tool = std::get_if<std::shared_ptr<StreamingTool>>(&it->second);
    if (!tool) {
        return notFound(name);
    }
    return *tool;
}

Result<ToolEntry> ToolRegistry::resolve(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return notFound(name);
    }
    return it->second;
}

Result<ToolResponse> ToolRegistry::execute(const std::string& name, const crow::json::rvalue& args) const {
    // The handle keeps the tool alive after the lock is released
    auto tool = getTool(name);
    if (!tool) {
        return std::move(tool.error());
    }
    return tool.value()->execute(args);
}

Result<std::unique_ptr<ChunkStream>> ToolRegistry::executeStreaming(const std::string& name,
                                                                    const crow::json::rvalue& args) const {
    auto tool = getStreamingTool(name);
    if (!tool) {
        return std::move(tool.error());
    }
    return tool.value()->executeStreaming(args);
}

std::vector<ToolMetadata> ToolRegistry::listTools() const {
    std::vector<ToolEntry> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        entries.reserve(tools_.size());
        for (const auto& item : tools_) {
            entries.push_back(item.second);
        }
    }

    std::vector<ToolMetadata> tools;
    tools.reserve(entries.size());
    for (const auto& entry : entries) {
        std::visit([&tools](const auto& tool) { tools.push_back(tool->metadata()); }, entry);
    }

    // Stable order for a given snapshot
    std::sort(tools.begin(), tools.end(), [](const ToolMetadata& a, const ToolMetadata& b) {
        return a.name < b.name;
    });
    return tools;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

bool ToolRegistry::isStreaming(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    return it != tools_.end() && std::holds_alternative<std::shared_ptr<StreamingTool>>(it->second);
}

void ToolRegistry::unregisterTool(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (tools_.erase(name) > 0) {
        CROW_LOG_INFO << "Unregistered tool: " << name;
    }
}

void ToolRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tools_.clear();
}

size_t ToolRegistry::toolCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

Error ToolRegistry::notFound(const std::string& name) {
    return Error::NotFound("Tool not found: " + name, name);
}

} // namespace toolhost
