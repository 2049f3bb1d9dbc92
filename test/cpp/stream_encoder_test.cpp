#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "mcp_constants.hpp"
#include "stream_encoder.hpp"
#include "test_utils.hpp"

using namespace toolhost;
using namespace toolhost::test;
namespace constants = toolhost::mcp::constants;

namespace {

// Records cancel() calls that arrive after the stream was destroyed
class TrackedStream : public ChunkStream {
public:
    TrackedStream(std::atomic<bool>& pulled, std::atomic<bool>& go,
                  std::atomic<bool>& destroyed, std::atomic<int>& late_cancels)
        : pulled_(pulled), go_(go), destroyed_(destroyed), late_cancels_(late_cancels) {}

    ~TrackedStream() override { destroyed_ = true; }

    StreamItem next() override {
        pulled_ = true;
        while (!go_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return StreamItem::end();
    }

    void cancel() override {
        if (destroyed_) {
            ++late_cancels_;
        }
    }

private:
    std::atomic<bool>& pulled_;
    std::atomic<bool>& go_;
    std::atomic<bool>& destroyed_;
    std::atomic<int>& late_cancels_;
};

} // namespace

TEST_CASE("StreamEncoder: completed stream", "[encoder]") {
    auto stream = GeneratorChunkStream::fromChunks({"a", "b", "c"});
    RecordingFrameWriter writer;

    auto summary = StreamEncoder::drain(*stream, RequestId(int64_t(1)), writer);
    REQUIRE(summary);
    REQUIRE(summary.value().outcome == StreamOutcome::Completed);
    REQUIRE(summary.value().chunks_sent == 3);

    auto frames = writer.frames();
    REQUIRE(frames.size() == 4);
    for (size_t i = 0; i < 3; ++i) {
        auto frame = parseFrame(frames[i]);
        REQUIRE(frame["id"].d() == 1);
        REQUIRE(std::string(frame["result"]["type"].s()) == constants::FRAME_STREAM_CHUNK);
        REQUIRE(frame["result"]["index"].d() == static_cast<double>(i));
    }
    REQUIRE(std::string(parseFrame(frames[0])["result"]["content"].s()) == "a");
    REQUIRE(std::string(parseFrame(frames[2])["result"]["content"].s()) == "c");

    auto last = parseFrame(frames[3]);
    REQUIRE(std::string(last["result"]["type"].s()) == constants::FRAME_STREAM_COMPLETE);
    REQUIRE_FALSE(last.has("error"));
}

TEST_CASE("StreamEncoder: empty stream sends only the completion", "[encoder]") {
    auto stream = GeneratorChunkStream::fromChunks({});
    RecordingFrameWriter writer;

    auto summary = StreamEncoder::drain(*stream, RequestId(std::string("s")), writer);
    REQUIRE(summary);
    REQUIRE(summary.value().chunks_sent == 0);
    REQUIRE(writer.size() == 1);
    auto frame = parseFrame(writer.frames()[0]);
    REQUIRE(std::string(frame["id"].s()) == "s");
    REQUIRE(std::string(frame["result"]["type"].s()) == constants::FRAME_STREAM_COMPLETE);
}

TEST_CASE("StreamEncoder: failure after chunks", "[encoder]") {
    int pulls = 0;
    GeneratorChunkStream stream([&pulls]() {
        ++pulls;
        if (pulls <= 2) {
            return StreamItem::chunk("line " + std::to_string(pulls));
        }
        return StreamItem::failure(Error::ToolExecution("Read failed", "disk"));
    });
    RecordingFrameWriter writer;

    auto summary = StreamEncoder::drain(stream, RequestId(int64_t(5)), writer);
    REQUIRE(summary);
    REQUIRE(summary.value().outcome == StreamOutcome::Failed);
    REQUIRE(summary.value().chunks_sent == 2);

    auto frames = writer.frames();
    REQUIRE(frames.size() == 3);
    auto error = parseFrame(frames[2]);
    REQUIRE(error["error"]["code"].d() == constants::TOOL_EXECUTION_ERROR);
    REQUIRE(std::string(error["error"]["message"].s()) == "Read failed");
    REQUIRE_FALSE(error.has("result"));
}

TEST_CASE("StreamEncoder: error frames always use the tool execution code", "[encoder]") {
    auto frame = parseFrame(StreamEncoder::errorFrame(RequestId(int64_t(1)), Error::Internal("oops")));
    REQUIRE(frame["error"]["code"].d() == constants::TOOL_EXECUTION_ERROR);
    REQUIRE(std::string(frame["error"]["data"]["category"].s()) == "ToolExecution");
}

TEST_CASE("StreamEncoder: write failure aborts the drain", "[encoder]") {
    bool released = false;
    GeneratorChunkStream stream([]() { return StreamItem::chunk("x"); }, [&released]() { released = true; });
    RecordingFrameWriter writer(2);

    auto summary = StreamEncoder::drain(stream, RequestId(int64_t(1)), writer);
    REQUIRE_FALSE(summary);
    REQUIRE(summary.error().category == ErrorCategory::Transport);
    REQUIRE(writer.size() == 2);
    REQUIRE(released);
}

TEST_CASE("StreamEncoder: cancellation", "[encoder][cancel]") {
    SECTION("Cancelled before the first pull writes nothing") {
        CancellationSource source;
        source.cancel();
        auto stream = GeneratorChunkStream::fromChunks({"a"});
        RecordingFrameWriter writer;

        auto summary = StreamEncoder::drain(*stream, RequestId(int64_t(1)), writer, source.token());
        REQUIRE(summary);
        REQUIRE(summary.value().outcome == StreamOutcome::Cancelled);
        REQUIRE(writer.size() == 0);
    }

    SECTION("Cancelling mid-stream stops frames and releases the producer") {
        CancellationSource source;
        std::atomic<bool> producer_done{false};
        ProducerChunkStream stream([&producer_done](ChunkChannel& channel) {
            size_t i = 0;
            while (channel.send("tick " + std::to_string(i++))) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            producer_done = true;
        });
        RecordingFrameWriter writer;

        std::thread canceller([&]() {
            while (writer.size() < 3) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            source.cancel();
        });

        auto summary = StreamEncoder::drain(stream, RequestId(int64_t(1)), writer, source.token());
        canceller.join();

        REQUIRE(summary);
        REQUIRE(summary.value().outcome == StreamOutcome::Cancelled);
        auto frames = writer.frames();
        REQUIRE(frames.size() == summary.value().chunks_sent);
        for (const auto& frame : frames) {
            REQUIRE(std::string(parseFrame(frame)["result"]["type"].s()) == constants::FRAME_STREAM_CHUNK);
        }

        // The producer saw the cancellation through its channel
        for (int i = 0; i < 500 && !producer_done; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        REQUIRE(producer_done.load());
    }
}

TEST_CASE("StreamEncoder: stream freed while cancel is still running callbacks", "[encoder][cancel]") {
    CancellationSource source;
    auto token = source.token();

    // Registered before the drain, so cancel() runs it first and stalls there
    std::atomic<bool> blocker_started{false};
    std::atomic<bool> release_blocker{false};
    token.onCancel([&]() {
        blocker_started = true;
        while (!release_blocker) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    std::atomic<bool> pulled{false};
    std::atomic<bool> go{false};
    std::atomic<bool> destroyed{false};
    std::atomic<int> late_cancels{0};
    std::atomic<bool> drained{false};
    std::atomic<bool> drain_cancelled{false};

    std::thread drainer([&]() {
        auto stream = std::make_unique<TrackedStream>(pulled, go, destroyed, late_cancels);
        RecordingFrameWriter writer;
        auto summary = StreamEncoder::drain(*stream, RequestId(int64_t(5)), writer, token);
        drain_cancelled = summary && summary.value().outcome == StreamOutcome::Cancelled;
        stream.reset();
        drained = true;
    });

    while (!pulled) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::thread canceller([&source]() { source.cancel(); });
    while (!blocker_started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    go = true;

    for (int i = 0; i < 2000 && !drained; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    bool drained_while_blocked = drained.load();
    release_blocker = true;
    canceller.join();
    drainer.join();

    REQUIRE(drained_while_blocked);
    REQUIRE(drain_cancelled);
    REQUIRE(destroyed);
    REQUIRE(late_cancels == 0);
}
