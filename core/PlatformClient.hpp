/**
 * @file PlatformClient.hpp
 * @brief Agent protocol of the IoT platform on top of the agent runtime
 *
 * Topics (all JSON, QoS 1):
 * - iot/event/fmt/json                          tag value events
 * - iot/log/fmt/json                            log records (array)
 * - iot/cmd/agent/<agent_id>/fmt/json           inbound commands
 * - iot/cmd/agent/<agent_id>/status/fmt/json    agent command status
 * - iot/cmd/device/<device_id>/status/fmt/json  device command status
 *
 * Authentication is carried by the broker credentials: username
 * "<client_id>_<agent_id>", password the agent token (see AgentConfig::resolve).
 */

#pragma once

#include "PlatformCodec.hpp"
#include "AgentConfig.hpp"
#include "Errors.hpp"
#include "domain/Agent.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace iotagent {

class PlatformClient {
public:
    /// Callback for commands addressed to this agent or its devices
    using CommandHandler = std::function<void(const CommandMessage&)>;

    /**
     * @brief Bind the platform protocol to an agent
     * @param agent Agent whose session carries the platform traffic
     * @param settings Platform identity; agentId selects the command topics
     * @throws std::invalid_argument if the platform settings are incomplete
     */
    PlatformClient(std::shared_ptr<domain::Agent> agent, PlatformSettings settings);
    ~PlatformClient();

    PlatformClient(const PlatformClient&) = delete;
    PlatformClient& operator=(const PlatformClient&) = delete;

    /**
     * @brief Subscribe to the agent command topic
     * @param handler Receives every well-formed command message
     * @note Malformed messages are reported to the error sink as Parse errors
     */
    void start(CommandHandler handler);
    void stop();
    bool isStarted() const { return subscription_ != 0; }

    domain::PublishResult sendEvent(const EventMessage& message);
    domain::PublishResult sendAgentCommandStatus(const CommandStatusMessage& message);
    domain::PublishResult sendDeviceCommandStatus(std::int64_t deviceId, const CommandStatusMessage& message);
    domain::PublishResult sendLogs(const std::vector<LogRecord>& records);

    void setErrorSink(ErrorSink sink) { errorSink_ = std::move(sink); }

    static std::string eventTopic() { return "iot/event/fmt/json"; }
    static std::string logTopic() { return "iot/log/fmt/json"; }
    static std::string agentCommandTopic(std::int64_t agentId);
    static std::string agentCommandStatusTopic(std::int64_t agentId);
    static std::string deviceCommandStatusTopic(std::int64_t deviceId);

private:
    void onCommand(const Message& message);

    std::shared_ptr<domain::Agent> agent_;
    PlatformSettings settings_;
    CommandHandler commandHandler_;
    domain::SubscriptionId subscription_ = 0;
    ErrorSink errorSink_ = logError;
};

} // namespace iotagent
