/**
 * @file main_cli.cpp
 * @brief Command-line agent for the IoT platform
 *
 * Connects through Paho MQTT, acknowledges platform commands (received, then
 * done), publishes a periodic heartbeat event and optionally issues one
 * request/response call once connected. With [platform] http_url set, the
 * agent configuration is fetched over HTTP first and the heartbeat reports
 * on the agent's "$state/$status" tag.
 */

#include "PahoMqttClient.hpp"
#include "CurlHttpClient.hpp"
#include "IClock.hpp"
#include "TomlConfig.hpp"
#include "PlatformClient.hpp"
#include "PlatformHttpClient.hpp"
#include "adapters/MqttTransportAdapter.hpp"
#include "domain/Agent.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

using namespace iotagent;

/// Global flag for graceful shutdown coordination
static volatile std::sig_atomic_t g_running = 1;

/**
 * @brief Signal handler for graceful shutdown
 * @param signal Signal number received
 */
void signalHandler(int signal) {
    (void)signal;
    g_running = 0;
}

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>          Configuration file (default: agent.toml)\n"
              << "  --event-interval <sec>   Heartbeat event interval (default: 10, 0 = off)\n"
              << "  --event-tag <id>         Platform tag id reported by the heartbeat\n"
              << "                           (default: $state/$status from the HTTP config, else 1)\n"
              << "  --call <topic> <payload> Issue one request once connected and print the reply\n"
              << "  --help                   Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [broker]\n"
              << "  uri = \"tcp://broker.example.com:1883\"\n"
              << "  [platform]\n"
              << "  client_id = 1\n"
              << "  agent_id = 42\n"
              << "  agent_token = \"secret\"\n"
              << "  http_url = \"https://api.example.com\"   # optional\n"
              << std::endl;
}

/**
 * @brief Acknowledge every command of a message: received, then done
 */
/**
 * @brief Resolve the heartbeat tag from the platform configuration
 * @return Tag id of $state/$status, or nothing if it cannot be fetched
 */
std::optional<std::int64_t> fetchStatusTag(const PlatformSettings& settings) {
    try {
        PlatformHttpClient http(std::make_shared<CurlHttpClient>(), settings);
        auto platformConfig = http.getConfig();
        if (const Tag* status = platformConfig.agent.tag.find("$state/$status")) {
            return status->id;
        }
        std::cerr << "[Platform] Agent tag tree has no $state/$status" << std::endl;
    } catch (const PlatformHttpError& e) {
        std::cerr << "[Platform] Config request failed: " << e.what() << std::endl;
    } catch (const PlatformParseError& e) {
        std::cerr << "[Platform] Config is malformed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

void acknowledgeCommands(PlatformClient& platform, const IClock& clock, const CommandMessage& commands) {
    for (const auto& device : commands.devices) {
        std::cout << "Command " << device.command.id << " for device " << device.deviceId << std::endl;
        for (auto status : {CommandStatus::Received, CommandStatus::Done}) {
            CommandStatusMessage message;
            message.id = device.command.id;
            message.status = status;
            message.timestamp = clock.epochMicros();
            platform.sendDeviceCommandStatus(device.deviceId, message);
        }
    }

    if (!commands.command) {
        return;
    }

    std::cout << "Agent command " << commands.command->id << std::endl;
    for (auto status : {CommandStatus::Received, CommandStatus::Done}) {
        CommandStatusMessage message;
        message.id = commands.command->id;
        message.status = status;
        message.timestamp = clock.epochMicros();
        platform.sendAgentCommandStatus(message);
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configFile = "agent.toml";
    int eventIntervalSeconds = 10;
    std::int64_t eventTag = 1;
    bool eventTagGiven = false;
    std::optional<std::pair<std::string, std::string>> callRequest;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if (arg == "--event-interval" && i + 1 < argc) {
                eventIntervalSeconds = std::stoi(argv[++i]);
            } else if (arg == "--event-tag" && i + 1 < argc) {
                eventTag = std::stoll(argv[++i]);
                eventTagGiven = true;
            } else if (arg == "--call" && i + 2 < argc) {
                std::string topic = argv[++i];
                std::string payload = argv[++i];
                callRequest = std::make_pair(topic, payload);
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }

    AgentConfig config;
    try {
        config = TomlConfig::loadFromFile(configFile);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto clock = std::make_shared<SystemClock>();
    auto mqttClient = std::make_shared<PahoMqttClient>();
    auto transport = std::make_shared<adapters::MqttTransportAdapter>(mqttClient);

    std::shared_ptr<domain::Agent> agent;
    try {
        agent = std::make_shared<domain::Agent>(config, transport, clock);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const auto& settings = agent->config().platform;
    if (settings.isSet() && !settings.httpUrl.empty() && !eventTagGiven) {
        if (auto statusTag = fetchStatusTag(settings)) {
            eventTag = *statusTag;
        }
    }

    std::unique_ptr<PlatformClient> platform;
    if (agent->config().platform.isSet()) {
        platform = std::make_unique<PlatformClient>(agent, agent->config().platform);
        platform->start([&platform, &clock](const CommandMessage& commands) {
            acknowledgeCommands(*platform, *clock, commands);
        });
    } else {
        std::cout << "No [platform] credentials, running as a plain MQTT agent" << std::endl;
    }

    bool callIssued = false;
    agent->setStateListener([&](domain::SessionState, domain::SessionState to, const std::string&) {
        if (to != domain::SessionState::Connected || !callRequest || callIssued) {
            return;
        }
        callIssued = true;
        agent->call(callRequest->first, callRequest->second, [](const domain::CallResult& result) {
            if (result.ok()) {
                std::cout << "Reply on " << result.responseTopic << ": " << result.payload << std::endl;
            } else {
                std::cerr << "Call failed (" << errorCodeToString(result.status) << "): "
                          << result.errorMessage << std::endl;
            }
        });
    });

    agent->setDeliveryListener([](const domain::DeliveryReport& report) {
        if (!report.delivered) {
            std::cerr << "Delivery to " << report.topic << " failed: " << report.message << std::endl;
        }
    });

    std::cout << "Starting IoT agent " << agent->session().clientId() << std::endl;
    agent->connect();

    auto nextEvent = clock->now();
    while (g_running) {
        agent->processEvents();

        if (eventIntervalSeconds > 0 && clock->now() >= nextEvent &&
            agent->state() == domain::SessionState::Connected) {
            nextEvent = clock->now() + std::chrono::seconds(eventIntervalSeconds);

            if (platform) {
                EventMessage event;
                event.tags.push_back({eventTag, std::string("online"), clock->epochMicros()});
                platform->sendEvent(event);
                platform->sendLogs({{LogLevel::Info, "heartbeat at " + clock->iso8601()}});
            } else {
                agent->publish("iot/agent/" + agent->session().clientId() + "/heartbeat",
                               "{\"ts\":\"" + clock->iso8601() + "\"}");
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::cout << "\nShutting down..." << std::endl;
    if (platform) {
        platform->stop();
    }
    agent->disconnect();

    std::cout << "Agent stopped." << std::endl;
    return 0;
}
