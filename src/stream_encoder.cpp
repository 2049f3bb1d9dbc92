#include "stream_encoder.hpp"
#include "mcp_constants.hpp"
#include "mcp_error_builder.hpp"
#include "protocol_codec.hpp"
#include <crow.h>

namespace toolhost {

namespace constants = toolhost::mcp::constants;

namespace {

// Ties the stream's cancel() to the token for the duration of a drain
class CancelRegistration {
public:
    CancelRegistration(const CancellationToken& token, ChunkStream& stream)
        : token_(token), id_(token.onCancel([&stream]() { stream.cancel(); })) {}

    ~CancelRegistration() { token_.removeCallback(id_); }

private:
    const CancellationToken& token_;
    size_t id_;
};

} // namespace

Result<StreamSummary> StreamEncoder::drain(ChunkStream& stream,
                                           const std::optional<RequestId>& id,
                                           FrameWriter& writer,
                                           const CancellationToken& cancellation) {
    CancelRegistration registration(cancellation, stream);
    StreamSummary summary;

    auto write = [&](const std::string& frame) -> Status {
        auto written = writer.writeFrame(frame);
        if (!written) {
            CROW_LOG_WARNING << "Stream write failed after " << summary.chunks_sent
                             << " chunks: " << written.error().describe();
            stream.cancel();
            return Error::Transport("Failed to write stream frame", written.error().describe());
        }
        return Status();
    };

    while (true) {
        if (cancellation.isCancelled()) {
            summary.outcome = StreamOutcome::Cancelled;
            return summary;
        }

        StreamItem item = stream.next();

        // A blocked next() returns End once cancelled; that is not a completion
        if (cancellation.isCancelled()) {
            summary.outcome = StreamOutcome::Cancelled;
            return summary;
        }

        if (item.isChunk()) {
            auto written = write(chunkFrame(id, summary.chunks_sent, item.content));
            if (!written) {
                return std::move(written.error());
            }
            ++summary.chunks_sent;
            continue;
        }

        if (item.isFailure()) {
            Error error = item.error ? *item.error : Error::ToolExecution("Stream failed");
            CROW_LOG_WARNING << "Stream failed at chunk " << summary.chunks_sent << ": " << error.describe();
            auto written = write(errorFrame(id, error));
            if (!written) {
                return std::move(written.error());
            }
            stream.cancel();
            summary.outcome = StreamOutcome::Failed;
            return summary;
        }

        auto written = write(completeFrame(id));
        if (!written) {
            return std::move(written.error());
        }
        summary.outcome = StreamOutcome::Completed;
        return summary;
    }
}

std::string StreamEncoder::chunkFrame(const std::optional<RequestId>& id, size_t index, const std::string& content) {
    crow::json::wvalue result;
    result["type"] = constants::FRAME_STREAM_CHUNK;
    result["index"] = static_cast<uint64_t>(index);
    result["content"] = content;
    return ProtocolCodec::encodeResponse(MCPResponse::success(id, std::move(result)));
}

std::string StreamEncoder::completeFrame(const std::optional<RequestId>& id) {
    crow::json::wvalue result;
    result["type"] = constants::FRAME_STREAM_COMPLETE;
    return ProtocolCodec::encodeResponse(MCPResponse::success(id, std::move(result)));
}

std::string StreamEncoder::errorFrame(const std::optional<RequestId>& id, const Error& error) {
    Error tool_error = error.category == ErrorCategory::ToolExecution
        ? error
        : Error::ToolExecution(error.message, error.details);
    return ProtocolCodec::encodeResponse(MCPResponse::failure(id, MCPErrorBuilder::fromError(tool_error)));
}

} // namespace toolhost
