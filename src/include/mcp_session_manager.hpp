#pragma once

#include "connection_context.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace toolhost {

/**
 * Tracks HTTP sessions, each one a ConnectionContext keyed by the
 * Mcp-Session-Id header. Sessions idle past the timeout are closed, which
 * cancels anything they still have in flight.
 */
class MCPSessionManager {
public:
    MCPSessionManager();
    ~MCPSessionManager();

    // Session management
    std::shared_ptr<ConnectionContext> createSession();
    std::shared_ptr<ConnectionContext> getSession(const std::string& session_id);
    bool removeSession(const std::string& session_id);
    size_t cleanupExpiredSessions();
    void closeAll();

    // Session configuration; minutes convert implicitly
    void setSessionTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds getSessionTimeout() const;

    // Session utilities
    bool isSessionValid(const std::string& session_id) const;
    size_t getActiveSessionCount() const;

private:
    std::unordered_map<std::string, std::shared_ptr<ConnectionContext>> sessions_;
    mutable std::mutex sessions_mutex_;
    std::chrono::milliseconds session_timeout_;

    std::string generateSessionId() const;
    bool isSessionExpired(const ConnectionContext& session) const;
};

} // namespace toolhost
