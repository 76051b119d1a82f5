#include "MqttTransportAdapter.hpp"
#include <algorithm>
#include <iostream>

namespace iotagent::adapters {

MqttTransportAdapter::MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient)
    : mqttClient_(std::move(mqttClient)),
      queue_(std::make_shared<EventQueue>()) {

    std::weak_ptr<EventQueue> weak = queue_;
    mqttClient_->setMessageCallback([weak](const MqttMessage& msg) {
        if (auto queue = weak.lock()) {
            Event event{Event::Kind::Message};
            event.topic = msg.topic;
            event.text = msg.payload;
            queue->push(std::move(event));
        }
    });

    mqttClient_->setConnectionCallback([weak](bool connected, const std::string& reason) {
        if (auto queue = weak.lock()) {
            Event event{Event::Kind::Connection};
            event.flag = connected;
            event.text = reason;
            queue->push(std::move(event));
        }
    });
}

MqttTransportAdapter::~MqttTransportAdapter() {
    mqttClient_->setMessageCallback(nullptr);
    mqttClient_->setConnectionCallback(nullptr);
}

ConnectOptions MqttTransportAdapter::toConnectOptions(const ports::Credentials& credentials) {
    ConnectOptions options;
    options.serverUri = credentials.endpoint;
    options.clientId = credentials.clientId;
    options.username = credentials.username;
    options.password = credentials.password;
    options.keepAliveSeconds = credentials.keepAliveSeconds;
    options.connectTimeoutSeconds = credentials.connectTimeoutSeconds;
    options.cleanSession = true;

    if (credentials.tls) {
        TlsConfig tls;
        tls.caPath = credentials.tls->caPath;
        tls.certPath = credentials.tls->certPath;
        tls.keyPath = credentials.tls->keyPath;
        tls.verifyServer = credentials.tls->verifyServer;
        options.tls = tls;
    }
    return options;
}

bool MqttTransportAdapter::connect(const ports::Credentials& credentials) {
    {
        // Outcomes of an earlier attempt must not be mistaken for this one
        std::lock_guard<std::mutex> lock(queue_->mutex);
        auto& events = queue_->events;
        events.erase(std::remove_if(events.begin(), events.end(), [](const Event& e) {
            return e.kind == Event::Kind::Connection;
        }), events.end());
    }
    return mqttClient_->connect(toConnectOptions(credentials));
}

void MqttTransportAdapter::disconnect() {
    mqttClient_->disconnect();
}

bool MqttTransportAdapter::isConnected() const {
    return mqttClient_->isConnected();
}

bool MqttTransportAdapter::publish(std::string_view topic, std::string_view payload, int qos,
                                   DeliveryHandler onDelivery) {
    IMqttClient::DeliveryCallback callback;
    if (onDelivery) {
        std::weak_ptr<EventQueue> weak = queue_;
        callback = [weak, handler = std::move(onDelivery)](bool delivered, const std::string& reason) {
            if (auto queue = weak.lock()) {
                Event event{Event::Kind::Delivery};
                event.flag = delivered;
                event.text = reason;
                event.onResult = handler;
                queue->push(std::move(event));
            }
        };
    }
    return mqttClient_->publish(std::string(topic), std::string(payload), qos, false, std::move(callback));
}

bool MqttTransportAdapter::subscribe(std::string_view topic, int qos, SubscribeHandler onResult) {
    IMqttClient::SubscribeCallback callback;
    if (onResult) {
        std::weak_ptr<EventQueue> weak = queue_;
        std::string filter(topic);
        callback = [weak, filter, handler = std::move(onResult)](bool granted, const std::string& reason) {
            if (auto queue = weak.lock()) {
                Event event{Event::Kind::Subscription};
                event.flag = granted;
                event.topic = filter;
                event.text = reason;
                event.onResult = handler;
                queue->push(std::move(event));
            }
        };
    }
    return mqttClient_->subscribe(std::string(topic), qos, std::move(callback));
}

bool MqttTransportAdapter::unsubscribe(std::string_view topic) {
    return mqttClient_->unsubscribe(std::string(topic));
}

void MqttTransportAdapter::setMessageHandler(MessageHandler handler) {
    messageHandler_ = std::move(handler);
}

void MqttTransportAdapter::setConnectionHandler(ConnectionHandler handler) {
    connectionHandler_ = std::move(handler);
}

void MqttTransportAdapter::EventQueue::push(Event event) {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back(std::move(event));
}

void MqttTransportAdapter::processEvents() {
    std::deque<Event> batch;
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        batch.swap(queue_->events);
    }

    for (auto& event : batch) {
        switch (event.kind) {
            case Event::Kind::Message:
                if (messageHandler_) {
                    messageHandler_(event.topic, event.text);
                }
                break;
            case Event::Kind::Connection:
                std::cout << "[Transport] " << (event.flag ? "Connected: " : "Disconnected: ")
                          << event.text << std::endl;
                if (connectionHandler_) {
                    connectionHandler_(event.flag, event.text);
                }
                break;
            case Event::Kind::Delivery:
                event.onResult(event.flag, event.text);
                break;
            case Event::Kind::Subscription:
                if (!event.flag) {
                    std::cerr << "[Transport] Subscription to " << event.topic
                              << " refused: " << event.text << std::endl;
                }
                event.onResult(event.flag, event.text);
                break;
        }
    }
}

} // namespace iotagent::adapters
