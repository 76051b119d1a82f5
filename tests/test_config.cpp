#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "../core/AgentConfig.hpp"
#include "../core/IdGenerator.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../platform/desktop/TomlConfig.hpp"
#include <regex>
#include <set>

using namespace iotagent;
using namespace std::chrono_literals;

TEST(AgentConfigTest, DefaultsAreValid) {
    AgentConfig config;
    EXPECT_TRUE(config.validate().empty());
    EXPECT_EQ(config.publisher.queueCapacity, 100u);
    EXPECT_EQ(config.publisher.defaultQos, QoS::AtLeastOnce);
}

TEST(AgentConfigTest, ValidateListsEveryProblem) {
    AgentConfig config;
    config.broker.uri = "http://broker";
    config.session.backoffBase = 5000ms;
    config.session.backoffCap = 1000ms;
    config.publisher.maxInflight = 0;
    config.rpc.responseTopic = "iot/rpc/+/res";

    auto problems = config.validate();

    EXPECT_EQ(problems.size(), 4u);
}

TEST(AgentConfigTest, AgentIdWithoutTokenIsInvalid) {
    AgentConfig config;
    config.platform.agentId = 42;

    EXPECT_EQ(config.validate().size(), 1u);
}

TEST(AgentConfigTest, HttpUrlNeedsHttpScheme) {
    AgentConfig config;
    config.platform.httpUrl = "ftp://api.example.com";

    auto problems = config.validate();

    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(problems[0], "platform.http_url must start with http:// or https://");
}

TEST(AgentConfigTest, ExpandsClientIdPlaceholder) {
    AgentConfig config;
    config.broker.clientId = "dev-9";

    EXPECT_EQ(config.expand("iot/rpc/{client_id}/res"), "iot/rpc/dev-9/res");
    EXPECT_EQ(config.expand("{client_id}/{client_id}"), "dev-9/dev-9");
    EXPECT_EQ(config.expand("plain/topic"), "plain/topic");
}

TEST(AgentConfigTest, ResolveGeneratesClientIdAndPlatformCredentials) {
    iotagent::testing::SequentialIdGenerator ids;
    AgentConfig config;
    config.platform = PlatformSettings{3, 17, "token"};

    config.resolve(ids);

    EXPECT_EQ(config.broker.clientId, "id-1");
    EXPECT_EQ(config.broker.username, "3_17");
    EXPECT_EQ(config.broker.password, "token");
}

TEST(AgentConfigTest, ResolveKeepsExplicitValues) {
    iotagent::testing::SequentialIdGenerator ids;
    AgentConfig config;
    config.broker.clientId = "fixed";
    config.broker.username = "operator";
    config.platform = PlatformSettings{3, 17, "token"};

    config.resolve(ids);

    EXPECT_EQ(config.broker.clientId, "fixed");
    EXPECT_EQ(config.broker.username, "operator");
    EXPECT_TRUE(config.broker.password.empty());
}

TEST(TomlConfigTest, ParsesAllSections) {
    auto config = TomlConfig::loadFromString(R"(
# agent configuration
[broker]
uri = "ssl://broker.example.com:8883"
client_id = "gateway-1"   # trailing comment
ca_path = "/etc/agent/ca.pem"
verify_server = false

[session]
keepalive_seconds = 15
backoff_base_ms = 500
backoff_cap_ms = 30000
backoff_jitter_pct = 10

[publisher]
queue_capacity = 250
max_inflight = 4
max_retries = 3
default_qos = 0

[rpc]
default_timeout_ms = 2500
response_topic = "replies/{client_id}"

[platform]
client_id = 7
agent_id = 42
agent_token = "s3cr#t"
http_url = "https://api.example.com"
http_timeout_ms = 5000
)");

    EXPECT_EQ(config.broker.uri, "ssl://broker.example.com:8883");
    EXPECT_EQ(config.broker.clientId, "gateway-1");
    EXPECT_EQ(config.broker.caPath, "/etc/agent/ca.pem");
    EXPECT_FALSE(config.broker.verifyServer);
    EXPECT_EQ(config.session.keepaliveInterval, 15s);
    EXPECT_EQ(config.session.backoffBase, 500ms);
    EXPECT_EQ(config.session.backoffCap, 30000ms);
    EXPECT_EQ(config.session.backoffJitterPct, 10);
    EXPECT_EQ(config.publisher.queueCapacity, 250u);
    EXPECT_EQ(config.publisher.maxInflight, 4u);
    EXPECT_EQ(config.publisher.maxRetries, 3);
    EXPECT_EQ(config.publisher.defaultQos, QoS::AtMostOnce);
    EXPECT_EQ(config.rpc.defaultTimeout, 2500ms);
    EXPECT_EQ(config.rpc.responseTopic, "replies/{client_id}");
    EXPECT_EQ(config.platform.clientId, 7);
    EXPECT_EQ(config.platform.agentId, 42);
    EXPECT_EQ(config.platform.agentToken, "s3cr#t");
    EXPECT_EQ(config.platform.httpUrl, "https://api.example.com");
    EXPECT_EQ(config.platform.httpTimeout, 5000ms);
    EXPECT_TRUE(config.validate().empty());
}

TEST(TomlConfigTest, UnknownKeysAreIgnored) {
    auto config = TomlConfig::loadFromString("[broker]\ncolour = \"blue\"\n[gps]\nlat = 1\n");

    EXPECT_EQ(config.broker.uri, AgentConfig{}.broker.uri);
}

TEST(TomlConfigTest, MalformedNumbersThrow) {
    EXPECT_THROW(TomlConfig::loadFromString("[session]\nkeepalive_seconds = soon\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[publisher]\nqueue_capacity = 10x\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[publisher]\ndefault_qos = 3\n"), std::runtime_error);
}

TEST(TomlConfigTest, MissingFileThrows) {
    EXPECT_THROW(TomlConfig::loadFromFile("/nonexistent/agent.toml"), std::runtime_error);
}

TEST(ReconnectPolicyTest, DoublesUpToCap) {
    adapters::ExponentialBackoffReconnectPolicy policy(std::make_shared<iotagent::testing::FixedRng>(), 1000ms, 8000ms, 20);

    EXPECT_EQ(policy.getBackoffDelay(0), 1000ms);
    EXPECT_EQ(policy.getBackoffDelay(1), 2000ms);
    EXPECT_EQ(policy.getBackoffDelay(3), 8000ms);
    EXPECT_EQ(policy.getBackoffDelay(10), 8000ms);
}

TEST(ReconnectPolicyTest, JitterStaysWithinBounds) {
    adapters::ExponentialBackoffReconnectPolicy high(std::make_shared<iotagent::testing::FixedRng>(100), 1000ms, 8000ms, 20);
    adapters::ExponentialBackoffReconnectPolicy low(std::make_shared<iotagent::testing::FixedRng>(-100), 1000ms, 8000ms, 20);

    EXPECT_EQ(high.getBackoffDelay(0), 1200ms);
    EXPECT_EQ(low.getBackoffDelay(0), 800ms);
    EXPECT_EQ(high.getBackoffDelay(5), 9600ms);

    adapters::ExponentialBackoffReconnectPolicy seeded(std::make_shared<StandardRng>(1234u), 1000ms, 8000ms, 20);
    for (int attempt = 0; attempt < 20; ++attempt) {
        auto delay = seeded.getBackoffDelay(attempt);
        EXPECT_GE(delay, 800ms);
        EXPECT_LE(delay, 9600ms);
    }
}

TEST(DeliveryPolicyTest, BoundedRetriesWithGrowingDelay) {
    adapters::BoundedDeliveryPolicy policy(2, 100ms, 1000ms, 2.0, 300ms);

    EXPECT_TRUE(policy.shouldRetry(1));
    EXPECT_TRUE(policy.shouldRetry(2));
    EXPECT_FALSE(policy.shouldRetry(3));
    EXPECT_EQ(policy.getRetryDelay(1), 100ms);
    EXPECT_EQ(policy.getRetryDelay(2), 200ms);
    EXPECT_EQ(policy.getRetryDelay(3), 300ms);
    EXPECT_EQ(policy.getAckTimeout(), 1000ms);
}

TEST(DeliveryPolicyTest, LateAttemptsStayAtTheCap) {
    adapters::BoundedDeliveryPolicy policy(100, 1000ms, 10s, 2.0, 1min);

    EXPECT_EQ(policy.getRetryDelay(7), 60000ms);
    EXPECT_EQ(policy.getRetryDelay(55), 60000ms);
    EXPECT_EQ(policy.getRetryDelay(100), 60000ms);
    EXPECT_EQ(policy.getRetryDelay(2000), 60000ms);
}

TEST(UuidGeneratorTest, ProducesUniqueVersion4Ids) {
    UuidGenerator generator;
    std::regex format("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = generator.next();
        EXPECT_TRUE(std::regex_match(id, format)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}
