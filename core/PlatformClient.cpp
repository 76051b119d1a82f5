#include "PlatformClient.hpp"
#include <iostream>
#include <stdexcept>

namespace iotagent {

PlatformClient::PlatformClient(std::shared_ptr<domain::Agent> agent, PlatformSettings settings)
    : agent_(std::move(agent)), settings_(std::move(settings)) {
    if (!agent_) {
        throw std::invalid_argument("PlatformClient requires an agent");
    }
    if (!settings_.isSet()) {
        throw std::invalid_argument("PlatformClient requires platform agent_id and agent_token");
    }
}

PlatformClient::~PlatformClient() {
    stop();
}

std::string PlatformClient::agentCommandTopic(std::int64_t agentId) {
    return "iot/cmd/agent/" + std::to_string(agentId) + "/fmt/json";
}

std::string PlatformClient::agentCommandStatusTopic(std::int64_t agentId) {
    return "iot/cmd/agent/" + std::to_string(agentId) + "/status/fmt/json";
}

std::string PlatformClient::deviceCommandStatusTopic(std::int64_t deviceId) {
    return "iot/cmd/device/" + std::to_string(deviceId) + "/status/fmt/json";
}

void PlatformClient::start(CommandHandler handler) {
    if (isStarted()) {
        return;
    }
    commandHandler_ = std::move(handler);

    std::string topic = agentCommandTopic(settings_.agentId);
    subscription_ = agent_->subscribe(topic, [this](const Message& message) {
        onCommand(message);
    }, QoS::AtLeastOnce);

    std::cout << "[Platform] Listening for commands on " << topic << std::endl;
}

void PlatformClient::stop() {
    if (!isStarted()) {
        return;
    }
    agent_->unsubscribe(subscription_);
    subscription_ = 0;
}

void PlatformClient::onCommand(const Message& message) {
    CommandMessage command;
    try {
        command = PlatformCodec::parseCommandMessage(message.payload);
    } catch (const PlatformParseError& e) {
        if (errorSink_) {
            errorSink_(AgentError{ErrorCode::Parse, e.what(), message.topic});
        }
        return;
    }

    if (commandHandler_) {
        commandHandler_(command);
    }
}

domain::PublishResult PlatformClient::sendEvent(const EventMessage& message) {
    return agent_->publish(eventTopic(), PlatformCodec::serialize(message), QoS::AtLeastOnce);
}

domain::PublishResult PlatformClient::sendAgentCommandStatus(const CommandStatusMessage& message) {
    return agent_->publish(agentCommandStatusTopic(settings_.agentId),
                           PlatformCodec::serialize(message), QoS::AtLeastOnce);
}

domain::PublishResult PlatformClient::sendDeviceCommandStatus(std::int64_t deviceId,
                                                              const CommandStatusMessage& message) {
    return agent_->publish(deviceCommandStatusTopic(deviceId),
                           PlatformCodec::serialize(message), QoS::AtLeastOnce);
}

domain::PublishResult PlatformClient::sendLogs(const std::vector<LogRecord>& records) {
    return agent_->publish(logTopic(), PlatformCodec::serializeLogs(records), QoS::AtLeastOnce);
}

} // namespace iotagent
