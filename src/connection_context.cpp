#include "connection_context.hpp"
#include <crow.h>

namespace toolhost {

ConnectionContext::ConnectionContext(std::string id)
    : id_(std::move(id)), last_activity_(std::chrono::steady_clock::now()) {}

ConnectionState ConnectionContext::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionContext::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialize_result_.has_value();
}

bool ConnectionContext::isClosed() const {
    return state() == ConnectionState::Closed;
}

std::optional<crow::json::wvalue> ConnectionContext::initializeResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialize_result_) {
        return std::nullopt;
    }
    return crow::json::wvalue(*initialize_result_);
}

crow::json::wvalue ConnectionContext::completeInitialize(MCPClientCapabilities capabilities,
                                                         MCPClientInfo client_info,
                                                         std::string protocol_version,
                                                         crow::json::wvalue result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialize_result_) {
        client_capabilities_ = std::move(capabilities);
        client_info_ = std::move(client_info);
        protocol_version_ = std::move(protocol_version);
        initialize_result_.emplace(std::move(result));
        if (state_ == ConnectionState::AwaitingInitialize) {
            state_ = ConnectionState::Ready;
        }
        CROW_LOG_INFO << "Connection " << id_ << " initialized (protocol " << protocol_version_
                      << ", client " << (client_info_.name.empty() ? "unknown" : client_info_.name) << ")";
    }
    return crow::json::wvalue(*initialize_result_);
}

MCPClientCapabilities ConnectionContext::clientCapabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_capabilities_;
}

MCPClientInfo ConnectionContext::clientInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

std::string ConnectionContext::protocolVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

std::optional<CancellationToken> ConnectionContext::beginRequest(const RequestId& request_id) {
    auto source = std::make_shared<CancellationSource>();
    bool closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_.emplace(request_id, source).second) {
            CROW_LOG_WARNING << "Connection " << id_ << ": request id " << requestIdToString(request_id)
                             << " is already in flight";
            return std::nullopt;
        }
        closed = state_ == ConnectionState::Closed;
    }

    // Work started after close is cancelled from the outset
    if (closed) {
        source->cancel();
    }
    return source->token();
}

void ConnectionContext::endRequest(const RequestId& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(request_id);
}

bool ConnectionContext::cancelRequest(const RequestId& request_id) {
    std::shared_ptr<CancellationSource> source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(request_id);
        if (it == in_flight_.end()) {
            return false;
        }
        source = it->second;
    }

    source->cancel();
    return true;
}

size_t ConnectionContext::cancelAll() {
    std::map<RequestId, std::shared_ptr<CancellationSource>> in_flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight = in_flight_;
    }

    for (auto& entry : in_flight) {
        entry.second->cancel();
    }
    return in_flight.size();
}

size_t ConnectionContext::inFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

void ConnectionContext::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Closed;
    }

    auto cancelled = cancelAll();
    if (cancelled > 0) {
        CROW_LOG_INFO << "Connection " << id_ << " closed, cancelled " << cancelled << " in-flight request(s)";
    }
}

void ConnectionContext::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = std::chrono::steady_clock::now();
}

std::chrono::steady_clock::time_point ConnectionContext::lastActivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

} // namespace toolhost
