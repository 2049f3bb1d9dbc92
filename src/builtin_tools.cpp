#include "builtin_tools.hpp"
#include "json_utils.hpp"
#include "mcp_constants.hpp"
#include <crow/logging.h>
#include <deque>
#include <filesystem>
#include <fstream>

namespace toolhost {

namespace {

ToolMetadata echoMetadata() {
    ToolMetadata metadata;
    metadata.name = "echo";
    metadata.description = "Echo a message back to the caller";
    metadata.version = mcp::constants::SERVER_VERSION;

    crow::json::wvalue schema;
    schema["type"] = "object";
    schema["properties"]["message"]["type"] = "string";
    schema["properties"]["message"]["description"] = "Text to echo";
    schema["required"][0] = "message";
    metadata.input_schema = std::move(schema);
    return metadata;
}

std::vector<std::string> trailingLines(std::ifstream& input, size_t count) {
    std::deque<std::string> window;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        window.push_back(std::move(line));
        if (window.size() > count) {
            window.pop_front();
        }
    }
    return std::vector<std::string>(window.begin(), window.end());
}

} // namespace

std::shared_ptr<UnaryTool> makeEchoTool() {
    return std::make_shared<FunctionTool>(echoMetadata(), [](const crow::json::rvalue& args) -> Result<ToolResponse> {
        auto message = JsonUtils::extractOptionalString(args, "message");
        if (!message) {
            return Error::ToolExecution("Missing message");
        }
        return ToolResponse::text("Echo: " + *message);
    });
}

TailTool::TailTool(TailToolConfig config)
    : config_(std::move(config)) {
    PathValidator::Config path_config;
    if (config_.root) {
        path_config.allowed_prefixes.push_back(config_.root->string());
    }
    path_validator_ = PathValidator(std::move(path_config));
}

ToolMetadata TailTool::metadata() const {
    ToolMetadata metadata;
    metadata.name = "tail";
    metadata.description = "Stream the last lines of a text file, one chunk per line";
    metadata.version = mcp::constants::SERVER_VERSION;

    crow::json::wvalue schema;
    schema["type"] = "object";
    schema["properties"]["path"]["type"] = "string";
    schema["properties"]["path"]["minLength"] = 1;
    schema["properties"]["path"]["description"] = "File to read";
    schema["properties"]["lines"]["type"] = "integer";
    schema["properties"]["lines"]["minimum"] = 1;
    schema["properties"]["lines"]["maximum"] = config_.max_lines;
    schema["properties"]["lines"]["description"] = "Number of trailing lines (default 10)";
    schema["required"][0] = "path";
    schema["additionalProperties"] = false;
    metadata.input_schema = std::move(schema);
    return metadata;
}

Status TailTool::validateInputs(const crow::json::rvalue& args) const {
    std::vector<ValidationError> violations;

    auto path = JsonUtils::extractOptionalString(args, "path");
    if (!path || path->empty()) {
        violations.push_back({"$.path", "a non-empty path is required"});
    }

    if (JsonUtils::isObject(args) && args.has("lines")) {
        auto lines = JsonUtils::extractInt(args, "lines");
        if (!lines || *lines < 1 || *lines > config_.max_lines) {
            violations.push_back({"$.lines", "must be an integer between 1 and " + std::to_string(config_.max_lines)});
        }
    }

    if (!violations.empty()) {
        return Error::Validation("Invalid arguments for tool 'tail'", std::move(violations));
    }
    return Status();
}

Result<std::unique_ptr<ChunkStream>> TailTool::executeStreaming(const crow::json::rvalue& args) const {
    auto valid = validateInputs(args);
    if (!valid) {
        return valid.error();
    }

    auto resolved = path_validator_.ValidatePath(*JsonUtils::extractOptionalString(args, "path"));
    if (!resolved) {
        return Error::ToolExecution(resolved.error().message, resolved.error().details);
    }
    std::string file_path = resolved.value();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return Error::ToolExecution("File not found", file_path);
    }

    // The producer outlives this call; it captures plain values only
    size_t line_count = static_cast<size_t>(JsonUtils::extractInt(args, "lines").value_or(DEFAULT_LINES));
    CROW_LOG_DEBUG << "tail: streaming last " << line_count << " line(s) of " << file_path;

    std::unique_ptr<ChunkStream> stream = std::make_unique<ProducerChunkStream>(
        [file_path, line_count](ChunkChannel& channel) {
            std::ifstream input(file_path);
            if (!input) {
                channel.fail(Error::ToolExecution("Cannot open file", file_path));
                return;
            }

            for (auto& line : trailingLines(input, line_count)) {
                if (!channel.send(std::move(line))) {
                    return;
                }
            }
            channel.close();
        });
    return std::move(stream);
}

} // namespace toolhost
