#include "MockTransport.hpp"

namespace iotagent::sim {

MockTransport::MockTransport() = default;

bool MockTransport::connect(const ports::Credentials& credentials) {
    lastCredentials_ = credentials;
    ++connectCount_;

    // A new attempt supersedes whatever the previous one left queued
    heldAcks_.clear();

    if (autoConnect_) {
        completeConnect(!failConnect_, failConnect_ ? "Connection refused" : "Mock connection established");
    }
    return true;
}

void MockTransport::completeConnect(bool success, std::string_view reason) {
    std::string text(reason);
    post([this, success, text]() {
        connected_ = success;
        if (connectionHandler_) {
            connectionHandler_(success, text);
        }
    });
}

void MockTransport::disconnect() {
    connected_ = false;
    heldAcks_.clear();
    subscriptions_.clear();
}

bool MockTransport::isConnected() const {
    return connected_;
}

bool MockTransport::publish(std::string_view topic, std::string_view payload, int qos,
                            DeliveryHandler onDelivery) {
    if (!connected_ || failPublish_) {
        return false;
    }

    MockMessage msg;
    msg.topic = std::string(topic);
    msg.payload = std::string(payload);
    msg.qos = qos;
    msg.timestamp = std::chrono::steady_clock::now();
    publishedMessages_.push_back(msg);

    if (!onDelivery) {
        return true;
    }

    if (qos > 0 && holdAcks_) {
        heldAcks_.push_back({std::move(onDelivery), msg.topic});
    } else {
        post([handler = std::move(onDelivery)]() { handler(true, "Delivered"); });
    }
    return true;
}

bool MockTransport::ackNext(bool delivered) {
    if (heldAcks_.empty()) {
        return false;
    }
    auto ack = std::move(heldAcks_.front());
    heldAcks_.pop_front();
    post([handler = std::move(ack.handler), delivered]() {
        handler(delivered, delivered ? "Delivered" : "Rejected by broker");
    });
    return true;
}

void MockTransport::ackAll(bool delivered) {
    while (ackNext(delivered)) {
    }
}

bool MockTransport::subscribe(std::string_view topic, int qos, SubscribeHandler onResult) {
    if (!connected_) return false;

    ++subscribeCalls_;
    std::string filter(topic);
    bool granted = refusedFilters_.count(filter) == 0;
    if (granted) {
        subscriptions_.insert(filter);
    }

    if (onResult) {
        std::string reason = granted ? "Granted QoS " + std::to_string(qos) : "SUBACK return code 128";
        post([handler = std::move(onResult), granted, reason]() { handler(granted, reason); });
    }
    return true;
}

bool MockTransport::unsubscribe(std::string_view topic) {
    if (!connected_) return false;
    return subscriptions_.erase(std::string(topic)) > 0;
}

void MockTransport::setMessageHandler(MessageHandler handler) {
    messageHandler_ = std::move(handler);
}

void MockTransport::setConnectionHandler(ConnectionHandler handler) {
    connectionHandler_ = std::move(handler);
}

void MockTransport::post(std::function<void()> event) {
    events_.push_back(std::move(event));
}

void MockTransport::processEvents() {
    // Events posted while running wait for the next call
    std::deque<std::function<void()>> batch;
    batch.swap(events_);

    for (auto& event : batch) {
        event();
    }
}

void MockTransport::simulateConnectionLoss(std::string_view reason) {
    std::string text(reason);
    heldAcks_.clear();
    subscriptions_.clear();
    connected_ = false;
    post([this, text]() {
        if (connectionHandler_) {
            connectionHandler_(false, text);
        }
    });
}

void MockTransport::injectMessage(std::string_view topic, std::string_view payload) {
    std::string t(topic);
    std::string p(payload);
    post([this, t, p]() {
        if (connected_ && messageHandler_) {
            messageHandler_(t, p);
        }
    });
}

std::vector<MockMessage> MockTransport::publishedTo(std::string_view topic) const {
    std::vector<MockMessage> result;
    for (const auto& msg : publishedMessages_) {
        if (msg.topic == topic) {
            result.push_back(msg);
        }
    }
    return result;
}

} // namespace iotagent::sim
