#include "mcp_session_manager.hpp"
#include "mcp_constants.hpp"
#include <crow.h>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace toolhost {

MCPSessionManager::MCPSessionManager()
    : session_timeout_(std::chrono::minutes(toolhost::mcp::constants::DEFAULT_SESSION_TIMEOUT_MINUTES)) {
}

MCPSessionManager::~MCPSessionManager() {
    closeAll();
}

std::shared_ptr<ConnectionContext> MCPSessionManager::createSession() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    std::string session_id = generateSessionId();
    while (sessions_.count(session_id) > 0) {
        session_id = generateSessionId();
    }

    auto session = std::make_shared<ConnectionContext>(session_id);
    sessions_[session_id] = session;
    CROW_LOG_DEBUG << "Created MCP session " << session_id;
    return session;
}

std::shared_ptr<ConnectionContext> MCPSessionManager::getSession(const std::string& session_id) {
    std::shared_ptr<ConnectionContext> expired;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return nullptr;
        }

        if (!isSessionExpired(*it->second)) {
            it->second->touch();
            return it->second;
        }

        expired = it->second;
        sessions_.erase(it);
    }

    expired->close();
    return nullptr;
}

bool MCPSessionManager::removeSession(const std::string& session_id) {
    std::shared_ptr<ConnectionContext> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }

    // Closing outside the lock; it runs cancellation callbacks
    session->close();
    CROW_LOG_DEBUG << "Removed MCP session " << session_id;
    return true;
}

size_t MCPSessionManager::cleanupExpiredSessions() {
    std::vector<std::shared_ptr<ConnectionContext>> expired;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (isSessionExpired(*it->second)) {
                expired.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& session : expired) {
        session->close();
    }
    if (!expired.empty()) {
        CROW_LOG_INFO << "Expired " << expired.size() << " idle MCP session(s)";
    }
    return expired.size();
}

void MCPSessionManager::closeAll() {
    std::unordered_map<std::string, std::shared_ptr<ConnectionContext>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }

    for (auto& entry : sessions) {
        entry.second->close();
    }
}

void MCPSessionManager::setSessionTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    session_timeout_ = timeout;
}

std::chrono::milliseconds MCPSessionManager::getSessionTimeout() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return session_timeout_;
}

bool MCPSessionManager::isSessionValid(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    return !isSessionExpired(*it->second);
}

size_t MCPSessionManager::getActiveSessionCount() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::string MCPSessionManager::generateSessionId() const {
    // Generate a random session ID
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dis;

    std::stringstream ss;
    for (int i = 0; i < 4; ++i) {
        ss << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    }
    return ss.str();
}

bool MCPSessionManager::isSessionExpired(const ConnectionContext& session) const {
    auto now = std::chrono::steady_clock::now();
    return (now - session.lastActivity()) > session_timeout_;
}

} // namespace toolhost
