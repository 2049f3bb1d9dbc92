#include "chunk_stream.hpp"
#include <crow.h>

namespace toolhost {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable callback_done;
    size_t next_id = 0;
    // Callback cancel() is executing right now, 0 when none
    size_t running_id = 0;
    std::thread::id running_thread;
    std::vector<std::pair<size_t, std::function<void()>>> callbacks;
};

bool CancellationToken::isCancelled() const {
    return state_ && state_->cancelled.load();
}

size_t CancellationToken::onCancel(std::function<void()> callback) const {
    if (!state_) {
        return 0;
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            size_t id = ++state_->next_id;
            state_->callbacks.emplace_back(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::removeCallback(size_t id) const {
    if (!state_ || id == 0) {
        return;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    auto& callbacks = state_->callbacks;
    for (auto it = callbacks.begin(); it != callbacks.end(); ++it) {
        if (it->first == id) {
            callbacks.erase(it);
            return;
        }
    }

    // Once this returns the callback no longer runs, so whatever it captured
    // may be destroyed. A callback removing itself must not wait on itself.
    if (state_->running_id == id && state_->running_thread != std::this_thread::get_id()) {
        state_->callback_done.wait(lock, [this, id] { return state_->running_id != id; });
    }
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationState>()) {}

void CancellationSource::cancel() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true)) {
        return;
    }

    // One at a time, outside the lock, so a callback may touch the token
    // again and removeCallback can tell which one is in progress
    while (!state_->callbacks.empty()) {
        auto entry = std::move(state_->callbacks.front());
        state_->callbacks.erase(state_->callbacks.begin());
        state_->running_id = entry.first;
        state_->running_thread = std::this_thread::get_id();
        lock.unlock();

        entry.second();

        lock.lock();
        state_->running_id = 0;
        state_->running_thread = std::thread::id();
        state_->callback_done.notify_all();
    }
}

bool CancellationSource::isCancelled() const {
    return state_->cancelled.load();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

StreamItem StreamItem::chunk(std::string content) {
    StreamItem item;
    item.kind = Kind::Chunk;
    item.content = std::move(content);
    return item;
}

StreamItem StreamItem::failure(Error error) {
    StreamItem item;
    item.kind = Kind::Failure;
    item.error = std::move(error);
    return item;
}

StreamItem StreamItem::end() {
    return StreamItem();
}

GeneratorChunkStream::GeneratorChunkStream(Generator generator, std::function<void()> on_cancel)
    : generator_(std::move(generator)), on_cancel_(std::move(on_cancel)) {}

StreamItem GeneratorChunkStream::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || cancelled_) {
        return StreamItem::end();
    }

    StreamItem item;
    try {
        item = generator_();
    } catch (const std::exception& e) {
        item = StreamItem::failure(Error::ToolExecution("Stream producer failed", e.what()));
    }

    if (!item.isChunk()) {
        finished_ = true;
    }
    return item;
}

void GeneratorChunkStream::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    if (on_cancel_) {
        on_cancel_();
    }
}

std::unique_ptr<ChunkStream> GeneratorChunkStream::fromChunks(std::vector<std::string> chunks) {
    auto remaining = std::make_shared<std::vector<std::string>>(std::move(chunks));
    auto position = std::make_shared<size_t>(0);

    return std::make_unique<GeneratorChunkStream>([remaining, position]() {
        if (*position >= remaining->size()) {
            return StreamItem::end();
        }
        return StreamItem::chunk((*remaining)[(*position)++]);
    });
}

bool ChunkChannel::send(std::string chunk) {
    return push(StreamItem::chunk(std::move(chunk)));
}

bool ChunkChannel::fail(Error error) {
    bool delivered = push(StreamItem::failure(std::move(error)));
    close();
    return delivered;
}

void ChunkChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ChunkChannel::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool ChunkChannel::push(StreamItem item) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !slot_.has_value() || cancelled_; });
    if (cancelled_ || closed_) {
        return false;
    }

    slot_ = std::move(item);
    lock.unlock();
    cv_.notify_all();
    return true;
}

StreamItem ChunkChannel::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return slot_.has_value() || closed_ || cancelled_; });

    if (cancelled_ || !slot_) {
        return StreamItem::end();
    }

    StreamItem item = std::move(*slot_);
    slot_.reset();
    if (item.isFailure()) {
        closed_ = true;
    }
    lock.unlock();
    cv_.notify_all();
    return item;
}

void ChunkChannel::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        slot_.reset();
    }
    cv_.notify_all();
}

ProducerChunkStream::ProducerChunkStream(Producer producer)
    : channel_(std::make_shared<ChunkChannel>()) {
    auto channel = channel_;
    thread_ = std::thread([channel, producer = std::move(producer)]() {
        try {
            producer(*channel);
        } catch (const std::exception& e) {
            CROW_LOG_WARNING << "Stream producer failed: " << e.what();
            channel->fail(Error::ToolExecution("Stream producer failed", e.what()));
        }
        channel->close();
    });
}

ProducerChunkStream::~ProducerChunkStream() {
    channel_->cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
}

StreamItem ProducerChunkStream::next() {
    return channel_->next();
}

void ProducerChunkStream::cancel() {
    channel_->cancel();
}

} // namespace toolhost
