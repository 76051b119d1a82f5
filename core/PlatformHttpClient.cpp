#include "PlatformHttpClient.hpp"
#include <iostream>

namespace iotagent {

PlatformHttpClient::PlatformHttpClient(std::shared_ptr<ports::IHttpClient> http, PlatformSettings settings)
    : http_(std::move(http)), settings_(std::move(settings)), baseUrl_(settings_.httpUrl) {

    if (!http_) {
        throw std::invalid_argument("Platform HTTP client requires an HTTP transport");
    }
    if (!settings_.isSet()) {
        throw std::invalid_argument("Platform HTTP client requires platform.agent_id and platform.agent_token");
    }
    if (baseUrl_.empty()) {
        throw std::invalid_argument("Platform HTTP client requires platform.http_url");
    }
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

std::string PlatformHttpClient::login() const {
    return std::to_string(settings_.clientId) + "_" + std::to_string(settings_.agentId);
}

PlatformConfig PlatformHttpClient::getConfig(const std::optional<std::string>& version) {
    std::vector<std::pair<std::string, std::string>> query;
    if (version) {
        query.emplace_back("version", *version);
    }
    auto config = PlatformCodec::parseConfig(exchange("GET", "/v1/agents/config", "", std::move(query)));
    std::cout << "[Platform] Config " << config.version << " for agent " << config.agent.name
              << " (" << config.agent.devices.size() << " device(s))" << std::endl;
    return config;
}

AgentDevicesCommands PlatformHttpClient::getCommands() {
    return PlatformCodec::parseCommands(exchange("GET", "/v1/commands"));
}

VersionedDeviceConfig PlatformHttpClient::getDeviceVersionedConfig(std::int64_t versionId) {
    return PlatformCodec::parseVersionedDeviceConfig(
        exchange("GET", "/v1/devices/config/" + std::to_string(versionId)));
}

void PlatformHttpClient::sendAgentCommandStatus(const CommandStatusMessage& message) {
    exchange("PATCH", "/v1/agents/" + std::to_string(settings_.agentId) + "/commands/" + message.id + "/status",
             statusBody(message));
}

void PlatformHttpClient::sendDeviceCommandStatus(std::int64_t deviceId, const CommandStatusMessage& message) {
    exchange("PATCH", "/v1/devices/" + std::to_string(deviceId) + "/commands/" + message.id + "/status",
             statusBody(message));
}

void PlatformHttpClient::sendEvent(const EventMessage& message) {
    exchange("POST", "/v1/events", PlatformCodec::serialize(message));
}

void PlatformHttpClient::sendLogs(const std::vector<LogRecord>& records) {
    exchange("POST", "/v1/logs", PlatformCodec::serializeLogs(records));
}

std::string PlatformHttpClient::statusBody(const CommandStatusMessage& message) {
    auto body = PlatformCodec::statusToJson(message);
    body.erase("id");
    return body.dump();
}

std::string PlatformHttpClient::exchange(const std::string& method, const std::string& path, const std::string& body,
                                         std::vector<std::pair<std::string, std::string>> query) {
    ports::HttpRequest request;
    request.method = method;
    request.url = baseUrl_ + path;
    request.query = std::move(query);
    request.body = body;
    request.username = login();
    request.password = settings_.agentToken;
    request.timeoutMs = static_cast<long>(settings_.httpTimeout.count());
    request.headers["Accept"] = "application/json";
    if (!body.empty()) {
        request.headers["Content-Type"] = "application/json";
    }

    auto response = http_->send(request);
    if (!response.error.empty()) {
        throw PlatformHttpError(0, "'" + request.url + "' request failed: " + response.error);
    }

    switch (response.statusCode) {
        case 200:
            return response.body;
        case 400:
            throw BadParamsError(response.body);
        case 401:
            throw UnauthorizedError(response.body);
        case 404:
            throw NotFoundError(response.body);
        case 500:
            throw InternalServerError(response.body);
        default:
            throw PlatformHttpError(response.statusCode,
                "'" + request.url + "' returns unexpected status code '" + std::to_string(response.statusCode) +
                "' with body '" + response.body + "'");
    }
}

} // namespace iotagent
