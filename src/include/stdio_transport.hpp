#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

#include "dispatcher.hpp"
#include "stream_encoder.hpp"

namespace toolhost {

// Writes each frame as one line and flushes it; safe to share between workers
class OstreamFrameWriter : public FrameWriter {
public:
    explicit OstreamFrameWriter(std::ostream& out) : out_(out) {}

    Status writeFrame(const std::string& frame) override;

    size_t framesWritten() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    size_t frames_written_ = 0;
};

/**
 * Newline-delimited JSON-RPC over a pair of streams (stdin/stdout in
 * production).
 *
 * Lines are handled inline until the handshake completes, so requests that
 * follow initialize see the initialized state. After that every line becomes
 * a worker task and a slow tool never holds up the next request. At end of
 * input the connection is closed, which cancels open streams, and the pool
 * drains before serve() returns.
 */
class StdioTransport {
public:
    StdioTransport(const Dispatcher& dispatcher, size_t worker_threads);

    // Returns the number of non-blank lines read
    size_t serve(std::istream& in, std::ostream& out);

private:
    void handleLine(const std::string& line, ConnectionContext& context, FrameWriter& writer) const;

    const Dispatcher& dispatcher_;
    size_t worker_threads_;
};

} // namespace toolhost
