#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <thread>

#include "chunk_stream.hpp"

using namespace toolhost;

TEST_CASE("CancellationSource and token", "[stream][cancel]") {
    CancellationSource source;
    auto token = source.token();
    REQUIRE_FALSE(token.isCancelled());

    int calls = 0;
    token.onCancel([&calls]() { ++calls; });
    auto removed = token.onCancel([&calls]() { calls += 100; });
    token.removeCallback(removed);

    source.cancel();
    source.cancel();
    REQUIRE(token.isCancelled());
    REQUIRE(source.isCancelled());
    REQUIRE(calls == 1);

    SECTION("Late registration runs immediately") {
        bool ran = false;
        token.onCancel([&ran]() { ran = true; });
        REQUIRE(ran);
    }

    SECTION("A default token never cancels") {
        CancellationToken never;
        REQUIRE_FALSE(never.isCancelled());
    }
}

TEST_CASE("CancellationToken: removing callbacks during cancel", "[stream][cancel]") {
    CancellationSource source;
    auto token = source.token();

    SECTION("removeCallback waits for a callback in progress") {
        std::atomic<bool> started{false};
        std::atomic<bool> finished{false};
        size_t id = token.onCancel([&]() {
            started = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            finished = true;
        });

        std::thread canceller([&source]() { source.cancel(); });
        while (!started) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        token.removeCallback(id);
        bool finished_on_return = finished.load();
        canceller.join();

        REQUIRE(finished_on_return);
    }

    SECTION("A queued callback removed while an earlier one runs is skipped") {
        std::atomic<bool> started{false};
        std::atomic<bool> release{false};
        std::atomic<int> later_calls{0};
        token.onCancel([&]() {
            started = true;
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
        size_t later = token.onCancel([&later_calls]() { ++later_calls; });

        std::thread canceller([&source]() { source.cancel(); });
        while (!started) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        token.removeCallback(later);
        release = true;
        canceller.join();

        REQUIRE(later_calls == 0);
    }

    SECTION("A callback may remove itself") {
        size_t id = 0;
        bool ran = false;
        id = token.onCancel([&]() {
            token.removeCallback(id);
            ran = true;
        });

        source.cancel();
        REQUIRE(ran);
    }
}

TEST_CASE("GeneratorChunkStream", "[stream]") {
    SECTION("Yields chunks in order, then End forever") {
        auto stream = GeneratorChunkStream::fromChunks({"a", "b"});
        auto first = stream->next();
        REQUIRE(first.isChunk());
        REQUIRE(first.content == "a");
        REQUIRE(stream->next().content == "b");
        REQUIRE(stream->next().isEnd());
        REQUIRE(stream->next().isEnd());
    }

    SECTION("Nothing follows a failure") {
        int pulls = 0;
        GeneratorChunkStream stream([&pulls]() {
            ++pulls;
            return pulls == 1 ? StreamItem::chunk("x") : StreamItem::failure(Error::ToolExecution("boom"));
        });
        REQUIRE(stream.next().isChunk());
        auto failed = stream.next();
        REQUIRE(failed.isFailure());
        REQUIRE(failed.error->message == "boom");
        REQUIRE(stream.next().isEnd());
        REQUIRE(pulls == 2);
    }

    SECTION("A throwing generator becomes a failure") {
        GeneratorChunkStream stream([]() -> StreamItem { throw std::runtime_error("exploded"); });
        auto item = stream.next();
        REQUIRE(item.isFailure());
        REQUIRE(item.error->category == ErrorCategory::ToolExecution);
        REQUIRE(item.error->details == "exploded");
    }

    SECTION("Cancel stops production and runs the release hook once") {
        int released = 0;
        GeneratorChunkStream stream([]() { return StreamItem::chunk("x"); }, [&released]() { ++released; });
        REQUIRE(stream.next().isChunk());
        stream.cancel();
        stream.cancel();
        REQUIRE(stream.next().isEnd());
        REQUIRE(released == 1);
    }
}

TEST_CASE("ChunkChannel", "[stream]") {
    SECTION("Hands items over in order") {
        ChunkChannel channel;
        std::thread producer([&channel]() {
            channel.send("one");
            channel.send("two");
            channel.close();
        });

        REQUIRE(channel.next().content == "one");
        REQUIRE(channel.next().content == "two");
        REQUIRE(channel.next().isEnd());
        producer.join();
    }

    SECTION("Holds at most one pending item") {
        ChunkChannel channel;
        std::atomic<int> sent{0};
        std::thread producer([&]() {
            for (int i = 0; i < 3; ++i) {
                if (!channel.send(std::to_string(i))) {
                    return;
                }
                ++sent;
            }
            channel.close();
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        // The first send fills the slot; the second waits for the consumer
        REQUIRE(sent.load() == 1);

        REQUIRE(channel.next().content == "0");
        REQUIRE(channel.next().content == "1");
        REQUIRE(channel.next().content == "2");
        REQUIRE(channel.next().isEnd());
        producer.join();
        REQUIRE(sent.load() == 3);
    }

    SECTION("Failure is delivered, then the channel ends") {
        ChunkChannel channel;
        std::thread producer([&channel]() {
            channel.send("partial");
            channel.fail(Error::ToolExecution("read error"));
        });

        REQUIRE(channel.next().isChunk());
        auto failed = channel.next();
        REQUIRE(failed.isFailure());
        REQUIRE(failed.error->message == "read error");
        REQUIRE(channel.next().isEnd());
        producer.join();
    }

    SECTION("Cancel unblocks a waiting producer") {
        ChunkChannel channel;
        std::atomic<bool> refused{false};
        std::thread producer([&]() {
            channel.send("fills the slot");
            refused = !channel.send("blocks until cancelled");
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.cancel();
        producer.join();

        REQUIRE(refused.load());
        REQUIRE(channel.isCancelled());
        REQUIRE(channel.next().isEnd());
    }
}

TEST_CASE("ProducerChunkStream", "[stream]") {
    SECTION("Runs the producer on its own thread") {
        auto caller = std::this_thread::get_id();
        std::thread::id producer_thread;
        ProducerChunkStream stream([&](ChunkChannel& channel) {
            producer_thread = std::this_thread::get_id();
            channel.send("hello");
            channel.close();
        });

        REQUIRE(stream.next().content == "hello");
        REQUIRE(stream.next().isEnd());
        REQUIRE(producer_thread != caller);
    }

    SECTION("A throwing producer surfaces as a failure") {
        ProducerChunkStream stream([](ChunkChannel&) { throw std::runtime_error("no file"); });
        auto item = stream.next();
        REQUIRE(item.isFailure());
        REQUIRE(item.error->details == "no file");
    }

    SECTION("Destruction releases a producer that is still sending") {
        std::atomic<bool> finished{false};
        {
            auto stream = std::make_unique<ProducerChunkStream>([&finished](ChunkChannel& channel) {
                while (channel.send("more")) {
                }
                finished = true;
            });
            REQUIRE(stream->next().isChunk());
        }
        REQUIRE(finished.load());
    }
}
