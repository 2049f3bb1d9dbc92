#include "stdio_transport.hpp"
#include "connection_context.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <cctype>
#include <crow/logging.h>
#include <istream>
#include <ostream>

namespace toolhost {

Status OstreamFrameWriter::writeFrame(const std::string& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << frame << '\n';
    out_.flush();
    if (!out_) {
        return Error::Transport("Failed to write frame", "output stream is in a failed state");
    }
    ++frames_written_;
    return Status();
}

size_t OstreamFrameWriter::framesWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_written_;
}

StdioTransport::StdioTransport(const Dispatcher& dispatcher, size_t worker_threads)
    : dispatcher_(dispatcher), worker_threads_(std::max<size_t>(1, worker_threads)) {}

size_t StdioTransport::serve(std::istream& in, std::ostream& out) {
    ConnectionContext context("stdio");
    OstreamFrameWriter writer(out);
    WorkerPool pool(worker_threads_);
    size_t lines = 0;

    CROW_LOG_INFO << "Serving JSON-RPC on stdio with " << pool.threadCount() << " worker(s)";

    std::string line;
    while (std::getline(in, line)) {
        if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); })) {
            continue;
        }
        ++lines;

        if (!context.isInitialized()) {
            handleLine(line, context, writer);
            continue;
        }

        if (!pool.post([this, line, &context, &writer]() { handleLine(line, context, writer); })) {
            CROW_LOG_WARNING << "Worker pool stopped, dropping request";
        }
    }

    CROW_LOG_INFO << "End of input after " << lines << " line(s), closing connection";
    context.close();
    pool.shutdown();
    return lines;
}

void StdioTransport::handleLine(const std::string& line, ConnectionContext& context, FrameWriter& writer) const {
    auto status = dispatcher_.handleLine(line, context, writer);
    if (!status) {
        CROW_LOG_ERROR << "Failed to answer request: " << status.error().describe();
    }
}

} // namespace toolhost
