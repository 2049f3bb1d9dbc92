#include "mcp_types.hpp"

namespace toolhost {

std::string requestIdToString(const RequestId& id) {
    if (std::holds_alternative<int64_t>(id)) {
        return std::to_string(std::get<int64_t>(id));
    }
    return std::get<std::string>(id);
}

crow::json::wvalue requestIdToJson(const RequestId& id) {
    if (std::holds_alternative<int64_t>(id)) {
        return crow::json::wvalue(std::get<int64_t>(id));
    }
    return crow::json::wvalue(std::get<std::string>(id));
}

bool MCPRequest::hasParams() const {
    return params && params.t() != crow::json::type::Null;
}

MCPResponse MCPResponse::success(std::optional<RequestId> id, crow::json::wvalue result) {
    MCPResponse response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

MCPResponse MCPResponse::failure(std::optional<RequestId> id, MCPError error) {
    MCPResponse response;
    response.id = std::move(id);
    response.error = std::move(error);
    return response;
}

crow::json::wvalue MCPServerCapabilities::toJson() const {
    crow::json::wvalue caps = crow::json::wvalue::object();
    caps["tools"]["listChanged"] = tools_list_changed;

    if (resources) {
        caps["resources"]["subscribe"] = resources_subscribe;
    }

    if (sampling) {
        caps["sampling"] = crow::json::wvalue::object();
    }

    return caps;
}

crow::json::wvalue ToolMetadata::toToolDefinition() const {
    crow::json::wvalue tool_def;
    tool_def["name"] = name;
    tool_def["description"] = description;
    tool_def["inputSchema"] = crow::json::wvalue(input_schema);
    tool_def["version"] = version;
    return tool_def;
}

crow::json::wvalue ToolResponse::toJson() const {
    crow::json::wvalue result;
    crow::json::wvalue content_array = crow::json::wvalue::list();

    crow::json::wvalue content_item;
    content_item["type"] = "text";
    content_item["text"] = content;
    content_array[0] = std::move(content_item);

    result["content"] = std::move(content_array);
    result["isError"] = is_error;
    return result;
}

crow::json::wvalue SamplingResponse::toJson() const {
    crow::json::wvalue result;
    result["model"] = model;
    result["role"] = "assistant";
    result["content"]["type"] = "text";
    result["content"]["text"] = content;
    result["stopReason"] = stop_reason;
    return result;
}

crow::json::wvalue ResourceDescriptor::toJson() const {
    crow::json::wvalue resource_def;
    resource_def["uri"] = uri;
    resource_def["name"] = name;
    if (!description.empty()) {
        resource_def["description"] = description;
    }
    resource_def["mimeType"] = mime_type;
    return resource_def;
}

} // namespace toolhost
