#pragma once

#include "error.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolhost {

struct CancellationState;

// Read side of a cancellation flag; a default token is never cancelled
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;

    // Runs the callback immediately when already cancelled. Returns an id for removeCallback.
    size_t onCancel(std::function<void()> callback) const;

    // Unregisters the callback; if cancel() is running it on another thread,
    // blocks until it returned
    void removeCallback(size_t id) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<CancellationState> state_;
};

// Owner side; cancel() is idempotent and runs every registered callback once
class CancellationSource {
public:
    CancellationSource();

    void cancel();
    bool isCancelled() const;
    CancellationToken token() const;

private:
    std::shared_ptr<CancellationState> state_;
};

// One pulled item: a chunk, a failure, or the end marker
struct StreamItem {
    enum class Kind { Chunk, Failure, End };

    Kind kind = Kind::End;
    std::string content;
    std::optional<Error> error;

    static StreamItem chunk(std::string content);
    static StreamItem failure(Error error);
    static StreamItem end();

    bool isChunk() const { return kind == Kind::Chunk; }
    bool isFailure() const { return kind == Kind::Failure; }
    bool isEnd() const { return kind == Kind::End; }
};

/**
 * A lazy, finite, single-pass sequence of output chunks.
 *
 * next() blocks until the producer has the next item. After a failure or the
 * end marker, and after cancel(), every further call returns End.
 */
class ChunkStream {
public:
    virtual ~ChunkStream() = default;

    virtual StreamItem next() = 0;

    // Stop producing and release whatever the producer holds
    virtual void cancel() = 0;
};

// Stream driven by a pull function, called once per next()
class GeneratorChunkStream : public ChunkStream {
public:
    using Generator = std::function<StreamItem()>;

    explicit GeneratorChunkStream(Generator generator, std::function<void()> on_cancel = nullptr);

    StreamItem next() override;
    void cancel() override;

    // Yields the given chunks in order, then End
    static std::unique_ptr<ChunkStream> fromChunks(std::vector<std::string> chunks);

private:
    Generator generator_;
    std::function<void()> on_cancel_;
    std::mutex mutex_;
    bool finished_ = false;
    std::atomic<bool> cancelled_{false};
};

/**
 * Bounded hand-off between a producer thread and the consumer, holding at
 * most one pending item. send() blocks until the consumer took the previous
 * item, so a slow reader paces the producer.
 */
class ChunkChannel : public ChunkStream {
public:
    ChunkChannel() = default;

    // Producer side. Both return false once the consumer cancelled.
    bool send(std::string chunk);
    bool fail(Error error);
    void close();

    bool isCancelled() const;

    StreamItem next() override;
    void cancel() override;

private:
    bool push(StreamItem item);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<StreamItem> slot_;
    bool closed_ = false;
    bool cancelled_ = false;
};

// Runs a producer on its own thread, feeding a ChunkChannel
class ProducerChunkStream : public ChunkStream {
public:
    using Producer = std::function<void(ChunkChannel&)>;

    explicit ProducerChunkStream(Producer producer);
    ~ProducerChunkStream() override;

    ProducerChunkStream(const ProducerChunkStream&) = delete;
    ProducerChunkStream& operator=(const ProducerChunkStream&) = delete;

    StreamItem next() override;
    void cancel() override;

private:
    std::shared_ptr<ChunkChannel> channel_;
    std::thread thread_;
};

} // namespace toolhost
