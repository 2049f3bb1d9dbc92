#pragma once

#include "chunk_stream.hpp"
#include "error.hpp"
#include "mcp_types.hpp"
#include <crow.h>
#include <functional>
#include <memory>

namespace toolhost {

/**
 * Shared contract of every tool: its metadata and an optional self-check of
 * the arguments. Implementations are invoked concurrently from many requests,
 * so any mutable state must be synchronized internally.
 */
class Tool {
public:
    virtual ~Tool() = default;

    virtual ToolMetadata metadata() const = 0;

    // Second line of defence after the schema validator; accepts by default
    virtual Status validateInputs(const crow::json::rvalue& args) const {
        (void)args;
        return Status();
    }
};

// A tool producing one terminal ToolResponse
class UnaryTool : public Tool {
public:
    // Errors are the tool's own failures (ToolExecution)
    virtual Result<ToolResponse> execute(const crow::json::rvalue& args) const = 0;
};

// A tool producing a lazy sequence of chunks, consumed once per call
class StreamingTool : public Tool {
public:
    virtual Result<std::unique_ptr<ChunkStream>> executeStreaming(const crow::json::rvalue& args) const = 0;
};

// Unary tool backed by a callable
class FunctionTool : public UnaryTool {
public:
    using Handler = std::function<Result<ToolResponse>(const crow::json::rvalue&)>;

    FunctionTool(ToolMetadata metadata, Handler handler)
        : metadata_(std::move(metadata)), handler_(std::move(handler)) {}

    ToolMetadata metadata() const override { return metadata_; }

    Result<ToolResponse> execute(const crow::json::rvalue& args) const override {
        return handler_(args);
    }

private:
    ToolMetadata metadata_;
    Handler handler_;
};

// Streaming tool backed by a callable
class FunctionStreamingTool : public StreamingTool {
public:
    using Handler = std::function<Result<std::unique_ptr<ChunkStream>>(const crow::json::rvalue&)>;

    FunctionStreamingTool(ToolMetadata metadata, Handler handler)
        : metadata_(std::move(metadata)), handler_(std::move(handler)) {}

    ToolMetadata metadata() const override { return metadata_; }

    Result<std::unique_ptr<ChunkStream>> executeStreaming(const crow::json::rvalue& args) const override {
        return handler_(args);
    }

private:
    ToolMetadata metadata_;
    Handler handler_;
};

} // namespace toolhost
