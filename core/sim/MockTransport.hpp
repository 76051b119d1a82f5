#pragma once

#include "../ports/ITransport.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace iotagent::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos;
    std::chrono::steady_clock::time_point timestamp;
};

// In-memory broker stand-in. Nothing happens synchronously: connection
// outcomes, inbound messages and delivery acks are queued and run from
// processEvents(), the way MqttTransportAdapter behaves.
class MockTransport : public ports::ITransport {
public:
    MockTransport();
    ~MockTransport() override = default;

    // ITransport interface
    bool connect(const ports::Credentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(std::string_view topic, std::string_view payload, int qos,
                 DeliveryHandler onDelivery) override;
    bool subscribe(std::string_view topic, int qos, SubscribeHandler onResult) override;
    bool unsubscribe(std::string_view topic) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    void processEvents() override;

    // Connection control
    void setAutoConnect(bool autoConnect) { autoConnect_ = autoConnect; }
    void setFailConnect(bool fail) { failConnect_ = fail; }
    void completeConnect(bool success, std::string_view reason = "");
    void simulateConnectionLoss(std::string_view reason = "Connection lost");

    // Delivery control
    void setFailPublish(bool fail) { failPublish_ = fail; }
    void setHoldAcks(bool hold) { holdAcks_ = hold; }
    bool ackNext(bool delivered = true);
    void ackAll(bool delivered = true);
    std::size_t heldAckCount() const { return heldAcks_.size(); }

    void injectMessage(std::string_view topic, std::string_view payload);

    // Subscription control: refused filters get a failure SUBACK
    void refuseSubscription(std::string_view filter) { refusedFilters_.insert(std::string(filter)); }
    void allowSubscription(std::string_view filter) { refusedFilters_.erase(std::string(filter)); }

    const std::vector<MockMessage>& getPublishedMessages() const { return publishedMessages_; }
    std::vector<MockMessage> publishedTo(std::string_view topic) const;
    void clearPublishedMessages() { publishedMessages_.clear(); }

    const std::set<std::string>& subscriptions() const { return subscriptions_; }
    int subscribeCalls() const { return subscribeCalls_; }
    int connectCount() const { return connectCount_; }
    const ports::Credentials& lastCredentials() const { return lastCredentials_; }

private:
    struct HeldAck {
        DeliveryHandler handler;
        std::string topic;
    };

    void post(std::function<void()> event);

    bool connected_ = false;
    bool autoConnect_ = true;
    bool failConnect_ = false;
    bool failPublish_ = false;
    bool holdAcks_ = false;

    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;

    std::deque<std::function<void()>> events_;
    std::deque<HeldAck> heldAcks_;
    std::vector<MockMessage> publishedMessages_;
    std::set<std::string> subscriptions_;
    std::set<std::string> refusedFilters_;
    int subscribeCalls_ = 0;
    int connectCount_ = 0;

    ports::Credentials lastCredentials_;
};

} // namespace iotagent::sim
