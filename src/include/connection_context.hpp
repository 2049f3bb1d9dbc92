#pragma once

#include "chunk_stream.hpp"
#include "mcp_types.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace toolhost {

enum class ConnectionState {
    AwaitingInitialize,
    Ready,
    Closed
};

/**
 * State owned by one client connection (a stdio pipe or an HTTP session):
 * the handshake state, what was negotiated at initialize, and a cancellation
 * source per in-flight request.
 */
class ConnectionContext {
public:
    explicit ConnectionContext(std::string id = "");

    ConnectionContext(const ConnectionContext&) = delete;
    ConnectionContext& operator=(const ConnectionContext&) = delete;

    const std::string& id() const { return id_; }

    ConnectionState state() const;
    // True once initialize completed, also after close()
    bool isInitialized() const;
    bool isClosed() const;

    // Result of the first initialize, if any
    std::optional<crow::json::wvalue> initializeResult() const;

    // First call wins; later calls leave the stored state alone. Returns the stored result.
    crow::json::wvalue completeInitialize(MCPClientCapabilities capabilities,
                                          MCPClientInfo client_info,
                                          std::string protocol_version,
                                          crow::json::wvalue result);

    MCPClientCapabilities clientCapabilities() const;
    MCPClientInfo clientInfo() const;
    std::string protocolVersion() const;

    // In-flight request tracking; the token is cancelled by cancelRequest/cancelAll/close.
    // Empty when a request with the same id is still in flight.
    std::optional<CancellationToken> beginRequest(const RequestId& request_id);
    void endRequest(const RequestId& request_id);
    bool cancelRequest(const RequestId& request_id);
    size_t cancelAll();
    size_t inFlightCount() const;

    // Cancels everything in flight and refuses further requests
    void close();

    void touch();
    std::chrono::steady_clock::time_point lastActivity() const;

private:
    const std::string id_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::AwaitingInitialize;
    MCPClientCapabilities client_capabilities_;
    MCPClientInfo client_info_;
    std::string protocol_version_;
    std::optional<crow::json::wvalue> initialize_result_;
    std::map<RequestId, std::shared_ptr<CancellationSource>> in_flight_;
    std::chrono::steady_clock::time_point last_activity_;
};

// Ends in-flight tracking for a request when it goes out of scope
class InFlightRequest {
public:
    InFlightRequest(ConnectionContext& context, const RequestId& request_id)
        : context_(context), request_id_(request_id), token_(context.beginRequest(request_id)) {}
    ~InFlightRequest() {
        if (token_) {
            context_.endRequest(request_id_);
        }
    }

    InFlightRequest(const InFlightRequest&) = delete;
    InFlightRequest& operator=(const InFlightRequest&) = delete;

    // False when the id was already taken; token() is then unusable
    bool accepted() const { return token_.has_value(); }
    const CancellationToken& token() const { return *token_; }

private:
    ConnectionContext& context_;
    RequestId request_id_;
    std::optional<CancellationToken> token_;
};

} // namespace toolhost
