#pragma once

#include "chunk_stream.hpp"
#include "error.hpp"
#include "mcp_types.hpp"
#include <optional>
#include <string>

namespace toolhost {

// Sink for encoded frames; each call writes one line and flushes it
class FrameWriter {
public:
    virtual ~FrameWriter() = default;
    virtual Status writeFrame(const std::string& frame) = 0;
};

enum class StreamOutcome {
    Completed,  // every chunk sent, then the completion frame
    Failed,     // chunks before the failure, then one error frame
    Cancelled   // peer went away; no terminal frame
};

struct StreamSummary {
    StreamOutcome outcome = StreamOutcome::Completed;
    size_t chunks_sent = 0;
};

/**
 * Drains a ChunkStream into framed JSON-RPC messages tied to a request id.
 *
 * Chunk frames carry indices 0..N-1 in order. Exactly one of the completion
 * frame or the error frame follows, unless the drain was cancelled, in which
 * case nothing more is written and the stream is told to cancel. A failed
 * write aborts the drain with a Transport error.
 */
class StreamEncoder {
public:
    static Result<StreamSummary> drain(ChunkStream& stream,
                                       const std::optional<RequestId>& id,
                                       FrameWriter& writer,
                                       const CancellationToken& cancellation = CancellationToken());

    static std::string chunkFrame(const std::optional<RequestId>& id, size_t index, const std::string& content);
    static std::string completeFrame(const std::optional<RequestId>& id);
    // Always carries the tool-execution code
    static std::string errorFrame(const std::optional<RequestId>& id, const Error& error);
};

} // namespace toolhost
