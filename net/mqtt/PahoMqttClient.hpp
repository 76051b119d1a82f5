/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C library implementation for desktop and server platforms
 *
 * Provides the IMqttClient implementation on top of the Eclipse Paho MQTT C
 * asynchronous API (MQTTAsync). Supports plain TCP and TLS endpoints with
 * username/password and optional client certificates.
 *
 * Reconnection, offline queueing and retries belong to the
 * agent runtime: this client never reconnects on its own.
 *
 * @note Paho invokes all callbacks from its own worker thread
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>

namespace iotagent {

/**
 * @brief Eclipse Paho MQTTAsync backed MQTT client
 *
 * Features:
 * - Per-publish delivery outcome through response-option tokens
 * - Pending delivery callbacks fail with a reason when the connection drops
 * - SUBACK outcome per subscribe request, including the 0x80 refusal
 * - One MQTTAsync handle at a time; connect() releases the previous one
 */
class PahoMqttClient : public IMqttClient {
public:
    /**
     * @brief Construct new Paho MQTT client instance
     * @note Client is not connected after construction - call connect() method
     */
    PahoMqttClient();

    /**
     * @brief Destructor - disconnects and destroys the Paho handle
     */
    ~PahoMqttClient() override;

    // Disable copy and assignment to prevent resource management issues
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const ConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                int qos, bool retained, DeliveryCallback onDelivery) override;

    bool subscribe(const std::string& topic, int qos, SubscribeCallback onResult) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    /**
     * @brief Map agent URI schemes onto the ones Paho understands
     * @param uri Configured endpoint (tcp://, ssl://, mqtt://, mqtts://)
     * @return URI with mqtt:// rewritten to tcp:// and mqtts:// to ssl://
     */
    static std::string normalizeServerUri(const std::string& uri);

    /**
     * @brief Interpret the granted QoS of a single-filter SUBACK
     * @return false for the failure code 0x80 or any other value outside 0..2
     */
    static bool isSubscriptionGranted(int grantedQos);

private:
    /// Time Paho may spend flushing in-flight messages on disconnect (ms)
    static constexpr int kDisconnectTimeoutMs = 2000;

    MQTTAsync client_;                    ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};  ///< Current connection state
    ConnectOptions options_;              ///< Kept alive for the pointers handed to Paho

    MessageCallback messageCallback_;     ///< User callback for incoming messages
    ConnectionCallback connectionCallback_; ///< User callback for connection events

    std::unordered_map<MQTTAsync_token, DeliveryCallback> deliveries_; ///< Pending publish outcomes
    std::unordered_map<MQTTAsync_token, SubscribeCallback> subscriptions_; ///< Pending SUBACKs
    std::mutex deliveryMutex_;            ///< Mutex protecting deliveries_ and subscriptions_

    /**
     * @brief Static callback for incoming MQTT messages
     * @param context Pointer to PahoMqttClient instance
     * @param topicName MQTT topic name
     * @param topicLen Length of topic name, 0 if null-terminated
     * @param message Paho message structure with payload and metadata
     * @return 1 to indicate successful message processing
     */
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);

    /**
     * @brief Static callback for successful MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param response Success response data (may contain session info)
     */
    static void onConnected(void* context, MQTTAsync_successData* response);

    /**
     * @brief Static callback for failed MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param response Failure response with error code and message
     */
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);

    /**
     * @brief Static callback for lost MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param cause Reason for connection loss (may be null)
     */
    static void connectionLost(void* context, char* cause);

    /**
     * @brief Static callbacks for publish completion
     * @param context Pointer to PahoMqttClient instance
     * @param response Response carrying the token of the finished publish
     */
    static void onPublishSuccess(void* context, MQTTAsync_successData* response);
    static void onPublishFailure(void* context, MQTTAsync_failureData* response);

    /**
     * @brief Static callbacks for the SUBACK of one subscribe request
     * @param context Pointer to PahoMqttClient instance
     * @param response Response carrying the token and the granted QoS
     */
    static void onSubscribeSuccess(void* context, MQTTAsync_successData* response);
    static void onSubscribeFailure(void* context, MQTTAsync_failureData* response);

    /// Remove and return the subscribe callback registered for a token
    SubscribeCallback takeSubscription(MQTTAsync_token token);

    /**
     * @brief Remove and return the delivery callback registered for a token
     * @param token Token returned by MQTTAsync_sendMessage
     * @return The callback, or an empty function if none is pending
     */
    DeliveryCallback takeDelivery(MQTTAsync_token token);

    /**
     * @brief Fail every pending delivery callback
     * @param reason Reason passed to each callback
     * @note Called when the connection is lost or closed
     */
    void failPendingDeliveries(const std::string& reason);

    /**
     * @brief Validate certificate files exist and are readable
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if all configured certificate files are accessible
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;

    /// Release the current Paho handle, if any
    void destroyHandle();
};

} // namespace iotagent
