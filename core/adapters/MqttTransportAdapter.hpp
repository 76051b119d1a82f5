#pragma once

#include "../ports/ITransport.hpp"
#include "../IMqttClient.hpp"
#include <deque>
#include <memory>
#include <mutex>

namespace iotagent::adapters {

// Marshals IMqttClient callbacks (library thread) onto the thread that
// calls processEvents(). Callbacks only hold the queue weakly, so a late
// delivery or SUBACK after the adapter is gone is dropped.
class MqttTransportAdapter : public ports::ITransport {
public:
    explicit MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient);
    ~MqttTransportAdapter() override;

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

    static ConnectOptions toConnectOptions(const ports::Credentials& credentials);

private:
    struct Event {
        enum class Kind { Message, Connection, Delivery, Subscription };

        Kind kind;
        bool flag = false;          // connected / delivered / granted
        std::string topic;
        std::string text;           // payload or reason
        std::function<void(bool, std::string_view)> onResult;
    };

    struct EventQueue {
        std::mutex mutex;
        std::deque<Event> events;

        void push(Event event);
    };

    std::shared_ptr<IMqttClient> mqttClient_;
    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;

    std::shared_ptr<EventQueue> queue_;
};

} // namespace iotagent::adapters
