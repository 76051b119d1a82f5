#include <gtest/gtest.h>
#include "../core/adapters/MqttTransportAdapter.hpp"
#include "PahoMqttClient.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace iotagent;

// Records what the adapter registers so the test can play the library thread
class FakeMqttClient : public IMqttClient {
public:
    bool connect(const ConnectOptions& options) override {
        lastOptions = options;
        return true;
    }
    void disconnect() override {}
    bool isConnected() const override { return true; }

    bool publish(const std::string& topic, const std::string&, int, bool, DeliveryCallback onDelivery) override {
        publishedTopics.push_back(topic);
        deliveries.push_back(std::move(onDelivery));
        return true;
    }

    bool subscribe(const std::string& topic, int, SubscribeCallback onResult) override {
        subscribedTopics.push_back(topic);
        subacks.push_back(std::move(onResult));
        return true;
    }

    bool unsubscribe(const std::string&) override { return true; }

    void setMessageCallback(MessageCallback callback) override { messageCallback = std::move(callback); }
    void setConnectionCallback(ConnectionCallback callback) override { connectionCallback = std::move(callback); }

    ConnectOptions lastOptions;
    std::vector<std::string> publishedTopics;
    std::vector<std::string> subscribedTopics;
    std::vector<DeliveryCallback> deliveries;
    std::vector<SubscribeCallback> subacks;
    MessageCallback messageCallback;
    ConnectionCallback connectionCallback;
};

class MqttTransportAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeMqttClient>();
        adapter_ = std::make_unique<adapters::MqttTransportAdapter>(client_);
    }

    std::shared_ptr<FakeMqttClient> client_;
    std::unique_ptr<adapters::MqttTransportAdapter> adapter_;
};

TEST_F(MqttTransportAdapterTest, DeliveryOutcomeRunsOnProcessEvents) {
    std::vector<bool> outcomes;
    ASSERT_TRUE(adapter_->publish("telemetry/dev-1", "1", 1,
        [&outcomes](bool delivered, std::string_view) { outcomes.push_back(delivered); }));
    ASSERT_EQ(client_->deliveries.size(), 1u);

    client_->deliveries[0](true, "Delivered");
    EXPECT_TRUE(outcomes.empty());

    adapter_->processEvents();
    EXPECT_EQ(outcomes, (std::vector<bool>{true}));
}

TEST_F(MqttTransportAdapterTest, LateDeliveryAfterDestructionIsDropped) {
    bool called = false;
    adapter_->publish("telemetry/dev-1", "1", 1, [&called](bool, std::string_view) { called = true; });
    adapter_->subscribe("sensors/#", 1, [&called](bool, std::string_view) { called = true; });

    adapter_.reset();

    // The library thread may still complete requests the adapter issued
    client_->deliveries[0](true, "Delivered");
    client_->subacks[0](true, "Granted QoS 1");
    EXPECT_FALSE(called);
}

TEST_F(MqttTransportAdapterTest, RefusedSubscriptionReachesHandler) {
    std::vector<std::string> outcomes;
    ASSERT_TRUE(adapter_->subscribe("secure/#", 1,
        [&outcomes](bool granted, std::string_view reason) {
            outcomes.push_back((granted ? "granted:" : "refused:") + std::string(reason));
        }));
    ASSERT_EQ(client_->subscribedTopics, (std::vector<std::string>{"secure/#"}));

    client_->subacks[0](false, "SUBACK return code 128");
    adapter_->processEvents();

    EXPECT_EQ(outcomes, (std::vector<std::string>{"refused:SUBACK return code 128"}));
}

TEST_F(MqttTransportAdapterTest, StaleConnectionResultIsPurgedOnConnect) {
    std::vector<bool> results;
    adapter_->setConnectionHandler([&results](bool connected, std::string_view) { results.push_back(connected); });

    client_->connectionCallback(false, "Connection refused");
    adapter_->connect(ports::Credentials{});
    adapter_->processEvents();
    EXPECT_TRUE(results.empty());

    client_->connectionCallback(true, "Connected");
    adapter_->processEvents();
    EXPECT_EQ(results, (std::vector<bool>{true}));
}

TEST(PahoMqttClientTest, SubackFailureCodeIsNotGranted) {
    EXPECT_TRUE(PahoMqttClient::isSubscriptionGranted(0));
    EXPECT_TRUE(PahoMqttClient::isSubscriptionGranted(1));
    EXPECT_TRUE(PahoMqttClient::isSubscriptionGranted(2));
    EXPECT_FALSE(PahoMqttClient::isSubscriptionGranted(0x80));
}

TEST(PahoMqttClientTest, NormalizesMqttSchemes) {
    EXPECT_EQ(PahoMqttClient::normalizeServerUri("mqtt://broker:1883"), "tcp://broker:1883");
    EXPECT_EQ(PahoMqttClient::normalizeServerUri("mqtts://broker:8883"), "ssl://broker:8883");
    EXPECT_EQ(PahoMqttClient::normalizeServerUri("ssl://broker:8883"), "ssl://broker:8883");
}
