/**
 * @file PlatformHttpClient.hpp
 * @brief HTTP API of the IoT platform
 *
 * Endpoints (JSON bodies, basic auth "<client_id>_<agent_id>" / agent token):
 * - GET   /v1/agents/config[?version=v]                         agent configuration
 * - GET   /v1/commands                                          pending commands
 * - GET   /v1/devices/config/<version_id>                       versioned device config
 * - PATCH /v1/agents/<agent_id>/commands/<command_id>/status    agent command status
 * - PATCH /v1/devices/<device_id>/commands/<command_id>/status  device command status
 * - POST  /v1/events                                            tag value events
 * - POST  /v1/logs                                              log records (array)
 *
 * Calls block for at most the configured timeout and throw on failure.
 */

#pragma once

#include "AgentConfig.hpp"
#include "PlatformCodec.hpp"
#include "PlatformConfig.hpp"
#include "ports/IHttpClient.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace iotagent {

/// Failed HTTP exchange; statusCode is 0 when no response arrived
class PlatformHttpError : public std::runtime_error {
public:
    PlatformHttpError(long statusCode, const std::string& what)
        : std::runtime_error(what), statusCode_(statusCode) {}

    long statusCode() const { return statusCode_; }

private:
    long statusCode_;
};

class BadParamsError : public PlatformHttpError {
public:
    explicit BadParamsError(const std::string& what) : PlatformHttpError(400, what) {}
};

class UnauthorizedError : public PlatformHttpError {
public:
    explicit UnauthorizedError(const std::string& what) : PlatformHttpError(401, what) {}
};

class NotFoundError : public PlatformHttpError {
public:
    explicit NotFoundError(const std::string& what) : PlatformHttpError(404, what) {}
};

class InternalServerError : public PlatformHttpError {
public:
    explicit InternalServerError(const std::string& what) : PlatformHttpError(500, what) {}
};

class PlatformHttpClient {
public:
    /**
     * @param http Transport for the exchanges (CurlHttpClient outside tests)
     * @param settings Platform identity and httpUrl
     * @throws std::invalid_argument without credentials or base URL
     */
    PlatformHttpClient(std::shared_ptr<ports::IHttpClient> http, PlatformSettings settings);

    /**
     * @brief Fetch the agent configuration
     * @param version Specific configuration version; latest when empty
     * @throws PlatformHttpError, PlatformParseError
     */
    PlatformConfig getConfig(const std::optional<std::string>& version = std::nullopt);
    AgentDevicesCommands getCommands();
    VersionedDeviceConfig getDeviceVersionedConfig(std::int64_t versionId);

    /// The command id travels in the URL; message.id is not sent
    void sendAgentCommandStatus(const CommandStatusMessage& message);
    void sendDeviceCommandStatus(std::int64_t deviceId, const CommandStatusMessage& message);
    void sendEvent(const EventMessage& message);
    void sendLogs(const std::vector<LogRecord>& records);

    std::string login() const;
    const std::string& baseUrl() const { return baseUrl_; }

private:
    std::string exchange(const std::string& method, const std::string& path, const std::string& body = "",
                         std::vector<std::pair<std::string, std::string>> query = {});

    static std::string statusBody(const CommandStatusMessage& message);

    std::shared_ptr<ports::IHttpClient> http_;
    PlatformSettings settings_;
    std::string baseUrl_;
};

} // namespace iotagent
