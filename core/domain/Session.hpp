#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace iotagent::domain {

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Closed
};

std::string stateToString(SessionState state);

// The one logical session of an agent. Owned by the ConnectionManager and
// handed out by const reference.
class Session {
public:
    explicit Session(std::string clientId) : clientId_(std::move(clientId)) {}

    const std::string& clientId() const { return clientId_; }
    SessionState state() const { return state_; }
    bool isConnected() const { return state_ == SessionState::Connected; }
    bool isClosed() const { return state_ == SessionState::Closed; }

    std::optional<std::chrono::steady_clock::time_point> lastConnectAt() const { return lastConnectAt_; }
    int backoffAttempts() const { return backoffAttempts_; }

    void setState(SessionState state) { state_ = state; }

    void markConnected(std::chrono::steady_clock::time_point at) {
        lastConnectAt_ = at;
        backoffAttempts_ = 0;
    }

    // Returns the attempt number the next backoff delay is computed for
    int nextBackoffAttempt() { return backoffAttempts_++; }

private:
    std::string clientId_;
    SessionState state_ = SessionState::Disconnected;
    std::optional<std::chrono::steady_clock::time_point> lastConnectAt_;
    int backoffAttempts_ = 0;
};

} // namespace iotagent::domain
