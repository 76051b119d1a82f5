/**
 * @file IMqttClient.hpp
 * @brief Wire-level MQTT client interface consumed by the transport adapter
 *
 * Abstracts the concrete MQTT library (Eclipse Paho on desktop and server
 * builds) behind a small callback-based interface. Implementations own the
 * network connection and the protocol state; the agent runtime never sees
 * library types.
 *
 * @note All callbacks may be invoked from a library-owned thread
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <optional>

namespace iotagent {

/**
 * @brief MQTT message as received from the broker
 *
 * Topic and payload are passed through byte-exact.
 */
struct MqttMessage {
    std::string topic;              ///< Topic the message was published on
    std::string payload;            ///< Raw payload bytes
    int qos = 0;                    ///< Quality of Service level (0, 1, or 2)
    bool retained = false;          ///< Retain flag set by the broker
};

/**
 * @brief TLS configuration for ssl:// endpoints
 *
 * @note Certificate files must be in PEM format
 * @note Client certificate and key are optional (server-auth only TLS)
 */
struct TlsConfig {
    std::string certPath;          ///< Path to client certificate file (.pem)
    std::string keyPath;           ///< Path to private key file (.pem)
    std::string caPath;            ///< Path to root CA certificate file (.pem)
    bool verifyServer = true;      ///< Enable server certificate validation
};

/**
 * @brief Parameters of a single connection attempt
 */
struct ConnectOptions {
    std::string serverUri;          ///< e.g. "tcp://broker:1883" or "ssl://broker:8883"
    std::string clientId;           ///< MQTT client identifier
    std::string username;           ///< Empty for anonymous connections
    std::string password;           ///< Ignored when username is empty
    int keepAliveSeconds = 60;      ///< MQTT protocol keep-alive
    int connectTimeoutSeconds = 30; ///< Handshake timeout
    bool cleanSession = true;       ///< Start without broker-side session state
    std::optional<TlsConfig> tls;   ///< Set for TLS connections
};

/**
 * @brief Platform-independent MQTT client interface
 *
 * Every operation is asynchronous: methods return whether the request was
 * accepted by the library, and the outcome is reported through callbacks.
 */
class IMqttClient {
public:
    /// Virtual destructor for proper cleanup in derived classes
    virtual ~IMqttClient() = default;

    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /// Callback function type for the outcome of a single publish
    using DeliveryCallback = std::function<void(bool delivered, const std::string& reason)>;

    /// Callback function type for the broker's answer to one subscribe request
    using SubscribeCallback = std::function<void(bool granted, const std::string& reason)>;

    /**
     * @brief Start connecting to the broker
     * @param options Endpoint, identity, credentials and TLS settings
     * @return true if the connection attempt was initiated, false otherwise
     * @note The result of the handshake is reported via the connection callback
     * @note Any previous connection handle is released first
     */
    virtual bool connect(const ConnectOptions& options) = 0;

    /**
     * @brief Disconnect from MQTT broker
     * @note Does not invoke the connection callback
     */
    virtual void disconnect() = 0;

    /**
     * @brief Check if currently connected to MQTT broker
     * @return true if connected, false otherwise
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @param topic MQTT topic to publish to
     * @param payload Message payload
     * @param qos Quality of Service level (0, 1, or 2)
     * @param retained Whether message should be retained by broker
     * @param onDelivery Invoked once with the delivery outcome (may be empty)
     * @return true if the message was accepted for sending, false otherwise
     * @note For QoS 0 the outcome reports the hand-off to the network
     * @note onDelivery is not invoked when false is returned
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos, bool retained, DeliveryCallback onDelivery) = 0;

    /**
     * @brief Subscribe to MQTT topic
     * @param topic MQTT topic filter to subscribe to (supports wildcards)
     * @param qos Maximum Quality of Service level for received messages
     * @param onResult Invoked once with the SUBACK outcome (may be empty)
     * @return true if subscription request was sent, false otherwise
     * @note A SUBACK carrying the failure code 0x80 is reported as not granted
     * @note onResult is not invoked when false is returned
     */
    virtual bool subscribe(const std::string& topic, int qos, SubscribeCallback onResult) = 0;

    /**
     * @brief Unsubscribe from MQTT topic
     * @param topic MQTT topic filter to unsubscribe from
     * @return true if unsubscription request was sent, false otherwise
     */
    virtual bool unsubscribe(const std::string& topic) = 0;

    /**
     * @brief Set callback for incoming MQTT messages
     * @param callback Function to call when message is received
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setMessageCallback(MessageCallback callback) = 0;

    /**
     * @brief Set callback for connection state changes
     * @param callback Function to call on handshake result or connection loss
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace iotagent
