#pragma once

#include "Message.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace iotagent {

class IIdGenerator;

/**
 * @brief Broker endpoint and credentials
 *
 * The URI scheme selects plain TCP or TLS: tcp:// and mqtt:// are plain,
 * ssl:// and mqtts:// use TLS with the certificate paths below.
 */
struct BrokerConfig {
    std::string uri = "tcp://localhost:1883";
    std::string clientId;                 ///< Empty: a random UUID is used
    std::string username;
    std::string password;
    std::string caPath;                   ///< Root CA (.pem), TLS only
    std::string certPath;                 ///< Client certificate (.pem), optional
    std::string keyPath;                  ///< Client private key (.pem), optional
    bool verifyServer = true;
};

struct SessionConfig {
    std::chrono::seconds keepaliveInterval{30};    ///< 0 disables liveness pings
    std::chrono::seconds keepaliveTimeout{10};
    std::chrono::seconds connectTimeout{30};
    std::chrono::milliseconds backoffBase{1000};
    std::chrono::milliseconds backoffCap{60000};
    int backoffJitterPct = 20;
    std::string keepaliveTopic = "iot/agent/{client_id}/ping";
};

struct PublisherConfig {
    std::size_t queueCapacity = 100;
    std::size_t maxInflight = 16;
    int maxRetries = 5;
    std::chrono::milliseconds ackTimeout{10000};
    std::chrono::milliseconds retryDelay{1000};
    QoS defaultQos = QoS::AtLeastOnce;
};

struct RpcConfig {
    std::chrono::milliseconds defaultTimeout{5000};
    std::string responseTopic = "iot/rpc/{client_id}/res";
};

/// Credentials of the IoT platform the original agent SDK talks to
struct PlatformSettings {
    std::int64_t clientId = 0;
    std::int64_t agentId = 0;
    std::string agentToken;
    std::string httpUrl;                        ///< HTTP API base URL; empty when unused
    std::chrono::milliseconds httpTimeout{20000};

    bool isSet() const { return agentId != 0 && !agentToken.empty(); }
};

struct AgentConfig {
    BrokerConfig broker;
    SessionConfig session;
    PublisherConfig publisher;
    RpcConfig rpc;
    PlatformSettings platform;

    /// Problems found in the configuration; empty when it is usable
    std::vector<std::string> validate() const;

    /// Replace "{client_id}" in @p pattern with the broker client id
    std::string expand(const std::string& pattern) const;

    /**
     * @brief Fill in derived values before the agent starts
     *
     * Generates a client id when none is configured and, when platform
     * credentials are present and no username is set, derives the MQTT
     * username ("<client_id>_<agent_id>") and password (agent token).
     */
    void resolve(IIdGenerator& ids);
};

} // namespace iotagent
