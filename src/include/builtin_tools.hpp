#pragma once

#include "config_manager.hpp"
#include "path_validator.hpp"
#include "tool.hpp"
#include <memory>

namespace toolhost {

// Unary demo tool: {"message": "hi"} -> "Echo: hi"
std::shared_ptr<UnaryTool> makeEchoTool();

/**
 * Streams the last N lines of a text file, one chunk per line.
 *
 * Lines are read on a producer thread and handed over through a capacity-1
 * channel, so a slow reader holds the file position rather than buffering
 * output.
 */
class TailTool : public StreamingTool {
public:
    explicit TailTool(TailToolConfig config);

    ToolMetadata metadata() const override;
    Status validateInputs(const crow::json::rvalue& args) const override;
    Result<std::unique_ptr<ChunkStream>> executeStreaming(const crow::json::rvalue& args) const override;

    static constexpr int DEFAULT_LINES = 10;

private:
    TailToolConfig config_;
    PathValidator path_validator_;
};

} // namespace toolhost
