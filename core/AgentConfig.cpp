#include "AgentConfig.hpp"
#include "IdGenerator.hpp"
#include "TopicFilter.hpp"

namespace iotagent {

namespace {

bool hasSupportedScheme(const std::string& uri) {
    for (const char* scheme : {"tcp://", "ssl://", "mqtt://", "mqtts://"}) {
        if (uri.rfind(scheme, 0) == 0) return true;
    }
    return false;
}

} // namespace

std::vector<std::string> AgentConfig::validate() const {
    std::vector<std::string> problems;

    if (broker.uri.empty()) {
        problems.push_back("broker.uri is empty");
    } else if (!hasSupportedScheme(broker.uri)) {
        problems.push_back("broker.uri must start with tcp://, ssl://, mqtt:// or mqtts://: " + broker.uri);
    }

    if (session.keepaliveInterval.count() < 0) {
        problems.push_back("session.keepalive_seconds must not be negative");
    }
    if (session.keepaliveInterval.count() > 0 && session.keepaliveTimeout.count() <= 0) {
        problems.push_back("session.keepalive_timeout_seconds must be positive");
    }
    if (session.connectTimeout.count() <= 0) {
        problems.push_back("session.connect_timeout_seconds must be positive");
    }
    if (session.backoffBase.count() <= 0) {
        problems.push_back("session.backoff_base_ms must be positive");
    }
    if (session.backoffCap < session.backoffBase) {
        problems.push_back("session.backoff_cap_ms must be >= backoff_base_ms");
    }
    if (session.backoffJitterPct < 0 || session.backoffJitterPct > 100) {
        problems.push_back("session.backoff_jitter_pct must be within 0..100");
    }

    if (publisher.queueCapacity == 0) {
        problems.push_back("publisher.queue_capacity must be positive");
    }
    if (publisher.maxInflight == 0) {
        problems.push_back("publisher.max_inflight must be positive");
    }
    if (publisher.maxRetries < 0) {
        problems.push_back("publisher.max_retries must not be negative");
    }
    if (publisher.ackTimeout.count() <= 0) {
        problems.push_back("publisher.ack_timeout_ms must be positive");
    }

    if (rpc.defaultTimeout.count() <= 0) {
        problems.push_back("rpc.default_timeout_ms must be positive");
    }
    if (!TopicFilter::isValidTopicName(rpc.responseTopic)) {
        problems.push_back("rpc.response_topic must be a topic name without wildcards");
    }
    if (session.keepaliveInterval.count() > 0 && !TopicFilter::isValidTopicName(session.keepaliveTopic)) {
        problems.push_back("session.keepalive_topic must be a topic name without wildcards");
    }

    if (platform.agentId != 0 && platform.agentToken.empty()) {
        problems.push_back("platform.agent_token is required when platform.agent_id is set");
    }
    if (!platform.httpUrl.empty() &&
        platform.httpUrl.rfind("http://", 0) != 0 && platform.httpUrl.rfind("https://", 0) != 0) {
        problems.push_back("platform.http_url must start with http:// or https://");
    }
    if (platform.httpTimeout.count() <= 0) {
        problems.push_back("platform.http_timeout_ms must be positive");
    }

    return problems;
}

std::string AgentConfig::expand(const std::string& pattern) const {
    static const std::string kPlaceholder = "{client_id}";

    std::string result = pattern;
    std::size_t pos = 0;
    while ((pos = result.find(kPlaceholder, pos)) != std::string::npos) {
        result.replace(pos, kPlaceholder.size(), broker.clientId);
        pos += broker.clientId.size();
    }
    return result;
}

void AgentConfig::resolve(IIdGenerator& ids) {
    if (broker.clientId.empty()) {
        broker.clientId = ids.next();
    }

    if (platform.isSet() && broker.username.empty()) {
        broker.username = std::to_string(platform.clientId) + "_" + std::to_string(platform.agentId);
        broker.password = platform.agentToken;
    }
}

} // namespace iotagent
