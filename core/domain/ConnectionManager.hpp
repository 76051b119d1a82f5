/**
 * @file ConnectionManager.hpp
 * @brief Session lifecycle over a transport: connect, backoff, keepalive
 *
 * State machine:
 *   Disconnected -> Connecting          start()
 *   Connecting   -> Connected           handshake succeeded
 *   Connecting   -> Reconnecting        handshake failed, rejected or timed out
 *   Connected    -> Reconnecting        unsolicited disconnect or keepalive failure
 *   Reconnecting -> Connecting          backoff timer elapsed
 *   any          -> Closed              shutdown()
 *
 * Nothing blocks: the connect deadline, the backoff delay and the keepalive
 * window are timestamps checked from checkTimers().
 */

#pragma once

#include "Session.hpp"
#include "../AgentConfig.hpp"
#include "../Errors.hpp"
#include "../IClock.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/ITransport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace iotagent::domain {

class ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
public:
    using StateListener = std::function<void(SessionState from, SessionState to, const std::string& reason)>;

    /**
     * @param config Resolved configuration (client id already set)
     */
    ConnectionManager(std::shared_ptr<ports::ITransport> transport,
                      std::shared_ptr<IClock> clock,
                      std::shared_ptr<ports::IPolicyEngine> policyEngine,
                      const AgentConfig& config);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Leave Disconnected and start the first connection attempt
     * @return false if the session was already started or is closed
     */
    bool start();

    /**
     * @brief Close the transport and enter the terminal Closed state
     * @note Idempotent; listeners see the final transition once
     */
    void shutdown();

    /// Hand queued transport events (connection results, acks, messages) to the runtime
    void pumpTransport();

    /// Connect deadline, reconnect backoff and keepalive
    void checkTimers();

    /// pumpTransport() followed by checkTimers()
    void processEvents();

    void addStateListener(StateListener listener);
    void setErrorSink(ErrorSink sink) { errorSink_ = std::move(sink); }

    const Session& session() const { return session_; }
    SessionState state() const { return session_.state(); }
    bool isConnected() const { return session_.isConnected(); }

    ports::Credentials credentials() const;
    const std::string& keepaliveTopic() const { return keepaliveTopic_; }

private:
    void beginConnect();
    void onTransportConnection(bool connected, const std::string& reason);
    void scheduleReconnect(const std::string& reason);
    void dropConnection(ErrorCode code, const std::string& reason);

    void sendKeepalive();
    void onKeepaliveAck(std::uint64_t generation, bool delivered, const std::string& reason);

    void transitionTo(SessionState next, const std::string& reason);
    void report(ErrorCode code, const std::string& message);

    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;

    AgentConfig config_;
    Session session_;
    std::string keepaliveTopic_;

    std::vector<StateListener> listeners_;
    ErrorSink errorSink_;

    std::chrono::steady_clock::time_point connectDeadline_;
    std::chrono::steady_clock::time_point nextAttemptAt_;

    // A ping is outstanding while pingDeadline_ is armed; acks carry the
    // generation they were sent under so late ones are ignored.
    bool pingOutstanding_ = false;
    std::uint64_t keepaliveGeneration_ = 0;
    std::chrono::steady_clock::time_point nextPingAt_;
    std::chrono::steady_clock::time_point pingDeadline_;
};

} // namespace iotagent::domain
