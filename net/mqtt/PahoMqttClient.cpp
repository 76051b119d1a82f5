#include "PahoMqttClient.hpp"
#include <iostream>
#include <fstream>
#include <vector>

namespace iotagent {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    destroyHandle();
}

std::string PahoMqttClient::normalizeServerUri(const std::string& uri) {
    if (uri.rfind("mqtts://", 0) == 0) {
        return "ssl://" + uri.substr(8);
    }
    if (uri.rfind("mqtt://", 0) == 0) {
        return "tcp://" + uri.substr(7);
    }
    return uri;
}

bool PahoMqttClient::connect(const ConnectOptions& options) {
    // Only one live connection per client: drop whatever handle we had
    disconnect();
    destroyHandle();

    options_ = options;
    options_.serverUri = normalizeServerUri(options.serverUri);

    std::cout << "[MQTT] Connecting to " << options_.serverUri
              << " as " << options_.clientId << std::endl;

    if (options_.tls && !validateCertificateFiles(*options_.tls)) {
        return false;
    }

    int rc = MQTTAsync_create(&client_, options_.serverUri.c_str(), options_.clientId.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to set callbacks, error code: " << rc << std::endl;
        destroyHandle();
        return false;
    }

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = options_.keepAliveSeconds;
    conn_opts.cleansession = options_.cleanSession ? 1 : 0;
    conn_opts.connectTimeout = options_.connectTimeoutSeconds;
    conn_opts.automaticReconnect = 0;   // reconnection is owned by the agent runtime
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;

    if (!options_.username.empty()) {
        conn_opts.username = options_.username.c_str();
        conn_opts.password = options_.password.c_str();
    }

    if (options_.tls) {
        const TlsConfig& tls = *options_.tls;
        if (!tls.caPath.empty()) ssl_opts.trustStore = tls.caPath.c_str();
        if (!tls.certPath.empty()) ssl_opts.keyStore = tls.certPath.c_str();
        if (!tls.keyPath.empty()) ssl_opts.privateKey = tls.keyPath.c_str();
        ssl_opts.enableServerCertAuth = tls.verifyServer ? 1 : 0;
        ssl_opts.verify = tls.verifyServer ? 1 : 0;
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        conn_opts.ssl = &ssl_opts;
    }

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (!client_) {
        return;
    }

    if (MQTTAsync_isConnected(client_)) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.timeout = kDisconnectTimeoutMs;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect request failed, error code: " << rc << std::endl;
        }
    }

    connected_ = false;
    failPendingDeliveries("Disconnected");
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                           int qos, bool retained, DeliveryCallback onDelivery) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.data()));
    pubmsg.payloadlen = static_cast<int>(payload.size());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    opts.onSuccess = onPublishSuccess;
    opts.onFailure = onPublishFailure;
    opts.context = this;

    // Hold the lock across the send so a fast completion cannot miss its entry
    std::lock_guard<std::mutex> lock(deliveryMutex_);
    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " rejected, error code: " << rc << std::endl;
        return false;
    }

    if (onDelivery) {
        deliveries_[opts.token] = std::move(onDelivery);
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos, SubscribeCallback onResult) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess = onSubscribeSuccess;
    opts.onFailure = onSubscribeFailure;
    opts.context = this;

    std::lock_guard<std::mutex> lock(deliveryMutex_);
    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Subscribe to " << topic << " rejected, error code: " << rc << std::endl;
        return false;
    }

    if (onResult) {
        subscriptions_[opts.token] = std::move(onResult);
    }
    return true;
}

bool PahoMqttClient::isSubscriptionGranted(int grantedQos) {
    return grantedQos >= 0 && grantedQos <= 2;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    if (client->messageCallback_) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen))
                                 : std::string(topicName);
        msg.payload = std::string(static_cast<char*>(message->payload),
                                  static_cast<std::size_t>(message->payloadlen));
        msg.qos = message->qos;
        msg.retained = message->retained != 0;

        client->messageCallback_(msg);
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;

    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected to " + client->options_.serverUri);
    }
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    if (client->connectionCallback_) {
        std::string reason = "Connection failed";
        if (response) {
            reason = "CONNACK return code " + std::to_string(response->code);
            if (response->message) {
                reason += " (" + std::string(response->message) + ")";
            }
        }
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = cause ? std::string(cause) : "Connection lost";
    client->failPendingDeliveries(reason);

    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onPublishSuccess(void* context, MQTTAsync_successData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (!response) return;

    auto callback = client->takeDelivery(response->token);
    if (callback) {
        callback(true, "Delivered");
    }
}

void PahoMqttClient::onPublishFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (!response) return;

    auto callback = client->takeDelivery(response->token);
    if (callback) {
        std::string reason = "Publish failed, code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
        callback(false, reason);
    }
}

void PahoMqttClient::onSubscribeSuccess(void* context, MQTTAsync_successData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (!response) return;

    auto callback = client->takeSubscription(response->token);
    if (!callback) {
        return;
    }
    // A SUBACK may still refuse the filter with return code 0x80
    int granted = response->alt.qos;
    if (isSubscriptionGranted(granted)) {
        callback(true, "Granted QoS " + std::to_string(granted));
    } else {
        callback(false, "SUBACK return code " + std::to_string(granted));
    }
}

void PahoMqttClient::onSubscribeFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (!response) return;

    auto callback = client->takeSubscription(response->token);
    if (callback) {
        std::string reason = "Subscribe failed, code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
        callback(false, reason);
    }
}

PahoMqttClient::SubscribeCallback PahoMqttClient::takeSubscription(MQTTAsync_token token) {
    std::lock_guard<std::mutex> lock(deliveryMutex_);
    auto it = subscriptions_.find(token);
    if (it == subscriptions_.end()) {
        return {};
    }
    auto callback = std::move(it->second);
    subscriptions_.erase(it);
    return callback;
}

PahoMqttClient::DeliveryCallback PahoMqttClient::takeDelivery(MQTTAsync_token token) {
    std::lock_guard<std::mutex> lock(deliveryMutex_);
    auto it = deliveries_.find(token);
    if (it == deliveries_.end()) {
        return {};
    }
    auto callback = std::move(it->second);
    deliveries_.erase(it);
    return callback;
}

void PahoMqttClient::failPendingDeliveries(const std::string& reason) {
    std::vector<DeliveryCallback> pending;
    {
        std::lock_guard<std::mutex> lock(deliveryMutex_);
        for (auto& entry : deliveries_) {
            pending.push_back(std::move(entry.second));
        }
        deliveries_.clear();
        // Unanswered subscribe requests are re-issued after the next connect
        subscriptions_.clear();
    }

    for (auto& callback : pending) {
        callback(false, reason);
    }
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    for (const auto* path : {&tlsConfig.caPath, &tlsConfig.certPath, &tlsConfig.keyPath}) {
        if (path->empty()) {
            continue;
        }
        std::ifstream file(*path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: Certificate file not found: " << *path << std::endl;
            return false;
        }
    }
    return true;
}

void PahoMqttClient::destroyHandle() {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
}

} // namespace iotagent
