#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace iotagent::ports {

struct TlsOptions {
    std::string caPath;
    std::string certPath;
    std::string keyPath;
    bool verifyServer = true;
};

struct Credentials {
    std::string endpoint;
    std::string clientId;
    std::string username;
    std::string password;
    int keepAliveSeconds = 60;
    int connectTimeoutSeconds = 30;
    std::optional<TlsOptions> tls;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    using MessageHandler = std::function<void(std::string_view topic, std::string_view payload)>;
    using ConnectionHandler = std::function<void(bool connected, std::string_view reason)>;
    using DeliveryHandler = std::function<void(bool delivered, std::string_view reason)>;
    using SubscribeHandler = std::function<void(bool granted, std::string_view reason)>;

    // Starts the handshake; the outcome arrives through the connection handler
    virtual bool connect(const Credentials& credentials) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // onDelivery may be empty; it runs from processEvents()
    virtual bool publish(std::string_view topic, std::string_view payload, int qos,
                         DeliveryHandler onDelivery) = 0;
    // onResult reports whether the broker granted the filter; it runs from processEvents()
    virtual bool subscribe(std::string_view topic, int qos, SubscribeHandler onResult) = 0;
    virtual bool unsubscribe(std::string_view topic) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;

    // Runs queued transport events on the caller's thread
    virtual void processEvents() = 0;
};

} // namespace iotagent::ports
