#include "ConnectionManager.hpp"
#include <iostream>

namespace iotagent::domain {

namespace {

bool isTlsUri(const std::string& uri) {
    return uri.rfind("ssl://", 0) == 0 || uri.rfind("mqtts://", 0) == 0;
}

} // namespace

ConnectionManager::ConnectionManager(std::shared_ptr<ports::ITransport> transport,
                                     std::shared_ptr<IClock> clock,
                                     std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                     const AgentConfig& config)
    : transport_(std::move(transport)),
      clock_(std::move(clock)),
      policyEngine_(std::move(policyEngine)),
      config_(config),
      session_(config.broker.clientId),
      keepaliveTopic_(config.expand(config.session.keepaliveTopic)) {
}

ports::Credentials ConnectionManager::credentials() const {
    ports::Credentials credentials;
    credentials.endpoint = config_.broker.uri;
    credentials.clientId = session_.clientId();
    credentials.username = config_.broker.username;
    credentials.password = config_.broker.password;
    credentials.connectTimeoutSeconds = static_cast<int>(config_.session.connectTimeout.count());

    if (isTlsUri(config_.broker.uri)) {
        ports::TlsOptions tls;
        tls.caPath = config_.broker.caPath;
        tls.certPath = config_.broker.certPath;
        tls.keyPath = config_.broker.keyPath;
        tls.verifyServer = config_.broker.verifyServer;
        credentials.tls = tls;
    }
    return credentials;
}

bool ConnectionManager::start() {
    if (session_.state() != SessionState::Disconnected) {
        return false;
    }

    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    transport_->setConnectionHandler([weak](bool connected, std::string_view reason) {
        if (auto self = weak.lock()) {
            self->onTransportConnection(connected, std::string(reason));
        }
    });

    beginConnect();
    return true;
}

void ConnectionManager::shutdown() {
    if (session_.isClosed()) {
        return;
    }
    transport_->disconnect();
    transitionTo(SessionState::Closed, "shutdown");
}

void ConnectionManager::pumpTransport() {
    transport_->processEvents();
}

void ConnectionManager::processEvents() {
    pumpTransport();
    checkTimers();
}

void ConnectionManager::addStateListener(StateListener listener) {
    listeners_.push_back(std::move(listener));
}

void ConnectionManager::beginConnect() {
    connectDeadline_ = clock_->now() + config_.session.connectTimeout;
    transitionTo(SessionState::Connecting, "connecting to " + config_.broker.uri);
    if (session_.state() != SessionState::Connecting) {
        return;
    }

    if (!transport_->connect(credentials())) {
        report(ErrorCode::Connection, "connect request rejected by transport");
        scheduleReconnect("connect rejected");
    }
}

void ConnectionManager::onTransportConnection(bool connected, const std::string& reason) {
    switch (session_.state()) {
        case SessionState::Connecting:
            if (connected) {
                auto now = clock_->now();
                session_.markConnected(now);
                pingOutstanding_ = false;
                nextPingAt_ = now + config_.session.keepaliveInterval;
                transitionTo(SessionState::Connected, reason);
            } else {
                report(ErrorCode::Connection, "handshake failed: " + reason);
                scheduleReconnect(reason);
            }
            break;

        case SessionState::Connected:
            if (!connected) {
                report(ErrorCode::SessionLost, "connection lost: " + reason);
                scheduleReconnect(reason);
            }
            break;

        default:
            // Late result of an attempt already abandoned
            break;
    }
}

void ConnectionManager::scheduleReconnect(const std::string& reason) {
    // The error sink may have shut the session down
    if (session_.isClosed()) {
        return;
    }

    int attempt = session_.nextBackoffAttempt();
    auto delay = policyEngine_->getReconnectPolicy().getBackoffDelay(attempt);
    nextAttemptAt_ = clock_->now() + delay;

    std::cout << "[ConnectionManager] Reconnecting in " << delay.count()
              << "ms (attempt " << attempt + 1 << ")" << std::endl;
    transitionTo(SessionState::Reconnecting, reason);
}

void ConnectionManager::dropConnection(ErrorCode code, const std::string& reason) {
    transport_->disconnect();
    report(code, reason);
    scheduleReconnect(reason);
}

void ConnectionManager::checkTimers() {
    auto now = clock_->now();

    switch (session_.state()) {
        case SessionState::Connecting:
            if (now >= connectDeadline_) {
                dropConnection(ErrorCode::Connection, "connect timeout");
            }
            break;

        case SessionState::Reconnecting:
            if (now >= nextAttemptAt_) {
                beginConnect();
            }
            break;

        case SessionState::Connected:
            if (config_.session.keepaliveInterval.count() <= 0) {
                break;
            }
            if (pingOutstanding_) {
                if (now >= pingDeadline_) {
                    dropConnection(ErrorCode::SessionLost, "keepalive timeout");
                }
            } else if (now >= nextPingAt_) {
                sendKeepalive();
            }
            break;

        default:
            break;
    }
}

void ConnectionManager::sendKeepalive() {
    std::uint64_t generation = ++keepaliveGeneration_;
    pingOutstanding_ = true;
    pingDeadline_ = clock_->now() + config_.session.keepaliveTimeout;

    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    bool accepted = transport_->publish(keepaliveTopic_, "", qosToInt(QoS::AtLeastOnce),
        [weak, generation](bool delivered, std::string_view reason) {
            if (auto self = weak.lock()) {
                self->onKeepaliveAck(generation, delivered, std::string(reason));
            }
        });

    if (!accepted) {
        dropConnection(ErrorCode::SessionLost, "keepalive rejected by transport");
    }
}

void ConnectionManager::onKeepaliveAck(std::uint64_t generation, bool delivered, const std::string& reason) {
    if (generation != keepaliveGeneration_ || !pingOutstanding_ || !session_.isConnected()) {
        return;
    }

    pingOutstanding_ = false;
    if (delivered) {
        nextPingAt_ = clock_->now() + config_.session.keepaliveInterval;
    } else {
        dropConnection(ErrorCode::SessionLost, "keepalive not acknowledged: " + reason);
    }
}

void ConnectionManager::transitionTo(SessionState next, const std::string& reason) {
    SessionState previous = session_.state();
    if (previous == next || previous == SessionState::Closed) {
        return;
    }

    if (previous == SessionState::Connected) {
        pingOutstanding_ = false;
        ++keepaliveGeneration_;
    }

    session_.setState(next);
    std::cout << "[ConnectionManager] " << stateToString(previous) << " -> "
              << stateToString(next) << " (" << reason << ")" << std::endl;

    // Listeners may register further listeners
    auto listeners = listeners_;
    for (const auto& listener : listeners) {
        listener(previous, next, reason);
    }
}

void ConnectionManager::report(ErrorCode code, const std::string& message) {
    AgentError error{code, message, ""};
    if (errorSink_) {
        errorSink_(error);
    } else {
        logError(error);
    }
}

} // namespace iotagent::domain
