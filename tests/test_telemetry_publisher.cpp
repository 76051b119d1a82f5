#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/domain/TelemetryPublisher.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <vector>

using namespace iotagent;
using namespace std::chrono_literals;

class TelemetryPublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.publisher.queueCapacity = 3;
        config_.publisher.maxInflight = 2;
        config_.publisher.maxRetries = 2;
        config_.publisher.ackTimeout = 1000ms;
        config_.publisher.retryDelay = 100ms;

        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->freezeTime();
        transport_ = std::make_shared<sim::MockTransport>();

        createPublisher();
        connect();
    }

    void createPublisher() {
        auto policies = std::make_shared<adapters::DefaultPolicyEngine>(
            config_, std::make_shared<iotagent::testing::FixedRng>());

        publisher_ = std::make_shared<domain::TelemetryPublisher>(
            transport_, clock_, policies, config_.publisher.queueCapacity, config_.publisher.maxInflight);
        publisher_->setDeliveryListener([this](const domain::DeliveryReport& report) { reports_.push_back(report); });
        publisher_->setErrorSink([this](const AgentError& error) { errors_.push_back(error); });
    }

    // Publisher without retries whose error sink closes it
    void createClosingOnFailure() {
        config_.publisher.maxRetries = 0;
        createPublisher();
        publisher_->onSessionEstablished();
        publisher_->setErrorSink([this](const AgentError& error) {
            errors_.push_back(error);
            publisher_->drainForShutdown();
        });
    }

    void connect() {
        transport_->connect(ports::Credentials{});
        transport_->processEvents();
        publisher_->onSessionEstablished();
    }

    // One runtime tick: transport events first, then the publisher
    void tick() {
        transport_->processEvents();
        publisher_->processEvents();
    }

    std::vector<std::string> publishedTopics() const {
        std::vector<std::string> topics;
        for (const auto& message : transport_->getPublishedMessages()) {
            topics.push_back(message.topic);
        }
        return topics;
    }

    AgentConfig config_;
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<domain::TelemetryPublisher> publisher_;
    std::vector<domain::DeliveryReport> reports_;
    std::vector<AgentError> errors_;
};

TEST_F(TelemetryPublisherTest, RejectsWithBackpressureWhenFull) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(publisher_->publish("sensors/" + std::to_string(i), "v", QoS::AtLeastOnce).ok());
    }

    auto result = publisher_->publish("sensors/overflow", "v", QoS::AtLeastOnce);

    EXPECT_EQ(result.status, ErrorCode::Backpressure);
    EXPECT_EQ(publisher_->size(), 3u);
    EXPECT_TRUE(transport_->getPublishedMessages().empty());
}

TEST_F(TelemetryPublisherTest, CapacityFreesUpAfterDelivery) {
    for (int i = 0; i < 3; ++i) {
        publisher_->publish("sensors/" + std::to_string(i), "v", QoS::AtLeastOnce);
    }
    publisher_->processEvents();
    tick();

    EXPECT_TRUE(publisher_->publish("sensors/next", "v", QoS::AtLeastOnce).ok());
}

TEST_F(TelemetryPublisherTest, HandsOffInEnqueueOrderWithinInflightLimit) {
    publisher_->publish("a/1", "p1", QoS::AtLeastOnce);
    publisher_->publish("a/2", "p2", QoS::AtLeastOnce);
    publisher_->publish("a/3", "p3", QoS::AtLeastOnce);

    publisher_->processEvents();
    EXPECT_EQ(publishedTopics(), (std::vector<std::string>{"a/1", "a/2"}));
    EXPECT_EQ(publisher_->inflightCount(), 2u);

    tick();
    EXPECT_EQ(publishedTopics(), (std::vector<std::string>{"a/1", "a/2", "a/3"}));

    tick();
    ASSERT_EQ(reports_.size(), 3u);
    for (const auto& report : reports_) {
        EXPECT_TRUE(report.delivered);
        EXPECT_EQ(report.attempts, 1);
    }
    EXPECT_EQ(publisher_->size(), 0u);
}

TEST_F(TelemetryPublisherTest, OneJobPerTopicInFlight) {
    transport_->setHoldAcks(true);
    publisher_->publish("t", "first", QoS::AtLeastOnce);
    publisher_->publish("t", "second", QoS::AtLeastOnce);

    publisher_->processEvents();
    ASSERT_EQ(transport_->getPublishedMessages().size(), 1u);
    EXPECT_EQ(transport_->getPublishedMessages()[0].payload, "first");

    transport_->ackNext(true);
    tick();

    ASSERT_EQ(transport_->getPublishedMessages().size(), 2u);
    EXPECT_EQ(transport_->getPublishedMessages()[1].payload, "second");
}

TEST_F(TelemetryPublisherTest, RetriesThenReportsDeliveryFailure) {
    transport_->setHoldAcks(true);
    publisher_->publish("t", "v", QoS::AtLeastOnce);
    publisher_->processEvents();

    transport_->ackNext(false);
    tick();
    EXPECT_EQ(transport_->getPublishedMessages().size(), 1u);   // waiting out the retry delay

    clock_->advance(100ms);
    publisher_->processEvents();
    EXPECT_EQ(transport_->getPublishedMessages().size(), 2u);

    transport_->ackNext(false);
    tick();
    clock_->advance(199ms);
    publisher_->processEvents();
    EXPECT_EQ(transport_->getPublishedMessages().size(), 2u);

    clock_->advance(1ms);
    publisher_->processEvents();
    EXPECT_EQ(transport_->getPublishedMessages().size(), 3u);

    transport_->ackNext(false);
    tick();

    ASSERT_EQ(reports_.size(), 1u);
    EXPECT_FALSE(reports_[0].delivered);
    EXPECT_EQ(reports_[0].attempts, 3);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, ErrorCode::DeliveryFailure);
    EXPECT_EQ(errors_[0].topic, "t");
    EXPECT_EQ(publisher_->size(), 0u);
}

TEST_F(TelemetryPublisherTest, AckTimeoutRetriesAndIgnoresStaleAck) {
    transport_->setHoldAcks(true);
    publisher_->publish("t", "v", QoS::AtLeastOnce);
    publisher_->processEvents();

    clock_->advance(1000ms);
    publisher_->processEvents();
    EXPECT_EQ(publisher_->inflightCount(), 0u);
    EXPECT_EQ(transport_->getPublishedMessages().size(), 1u);

    clock_->advance(100ms);
    publisher_->processEvents();
    EXPECT_EQ(transport_->getPublishedMessages().size(), 2u);

    // The first attempt's ack arrives late and must not complete the job
    transport_->ackNext(true);
    tick();
    EXPECT_TRUE(reports_.empty());

    transport_->ackNext(true);
    tick();
    ASSERT_EQ(reports_.size(), 1u);
    EXPECT_TRUE(reports_[0].delivered);
    EXPECT_EQ(reports_[0].attempts, 2);
}

TEST_F(TelemetryPublisherTest, SessionLossRequeuesInOrder) {
    transport_->setHoldAcks(true);
    publisher_->publish("a", "1", QoS::AtLeastOnce);
    publisher_->publish("b", "2", QoS::AtLeastOnce);
    publisher_->processEvents();
    ASSERT_EQ(publisher_->inflightCount(), 2u);

    transport_->simulateConnectionLoss();
    transport_->processEvents();
    publisher_->onSessionLost();

    EXPECT_EQ(publisher_->inflightCount(), 0u);
    EXPECT_EQ(publisher_->queuedCount(), 2u);
    EXPECT_TRUE(publisher_->publish("c", "3", QoS::AtLeastOnce).ok());

    transport_->clearPublishedMessages();
    publisher_->processEvents();
    EXPECT_TRUE(transport_->getPublishedMessages().empty());

    transport_->setHoldAcks(false);
    connect();
    publisher_->processEvents();
    EXPECT_EQ(publishedTopics(), (std::vector<std::string>{"a", "b"}));

    tick();
    EXPECT_EQ(publishedTopics(), (std::vector<std::string>{"a", "b", "c"}));
    tick();
    EXPECT_EQ(reports_.size(), 3u);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(TelemetryPublisherTest, AtMostOnceCompletesAtHandOff) {
    transport_->setHoldAcks(true);
    publisher_->publish("t", "v", QoS::AtMostOnce);

    publisher_->processEvents();

    ASSERT_EQ(reports_.size(), 1u);
    EXPECT_TRUE(reports_[0].delivered);
    EXPECT_EQ(transport_->getPublishedMessages()[0].qos, 0);
    EXPECT_EQ(publisher_->inflightCount(), 0u);
    EXPECT_EQ(transport_->heldAckCount(), 0u);
}

TEST_F(TelemetryPublisherTest, ShutdownHandsOffPendingJobs) {
    transport_->setHoldAcks(true);
    publisher_->publish("t", "first", QoS::AtLeastOnce);
    publisher_->publish("t", "second", QoS::AtLeastOnce);
    publisher_->processEvents();

    publisher_->drainForShutdown();

    ASSERT_EQ(reports_.size(), 2u);
    EXPECT_TRUE(reports_[0].delivered);
    EXPECT_TRUE(reports_[1].delivered);
    EXPECT_EQ(transport_->getPublishedMessages().size(), 2u);
    EXPECT_TRUE(errors_.empty());
    EXPECT_TRUE(publisher_->isClosed());
    EXPECT_EQ(publisher_->publish("t", "late", QoS::AtLeastOnce).status, ErrorCode::Closed);
}

TEST_F(TelemetryPublisherTest, ShutdownWhileOfflineFailsPendingJobs) {
    publisher_->publish("t", "v", QoS::AtLeastOnce);
    transport_->simulateConnectionLoss();
    transport_->processEvents();
    publisher_->onSessionLost();

    publisher_->drainForShutdown();

    ASSERT_EQ(reports_.size(), 1u);
    EXPECT_FALSE(reports_[0].delivered);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, ErrorCode::DeliveryFailure);
}

TEST_F(TelemetryPublisherTest, ErrorSinkMayCloseOnFinalNack) {
    createClosingOnFailure();
    transport_->setHoldAcks(true);
    publisher_->publish("sensors/a", "1", QoS::AtLeastOnce);
    publisher_->publish("sensors/a", "2", QoS::AtLeastOnce);
    publisher_->publish("sensors/b", "3", QoS::AtLeastOnce);
    publisher_->processEvents();
    ASSERT_EQ(publisher_->inflightCount(), 2u);

    transport_->ackNext(false);
    tick();

    EXPECT_TRUE(publisher_->isClosed());
    EXPECT_EQ(publisher_->size(), 0u);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, ErrorCode::DeliveryFailure);
    EXPECT_EQ(errors_[0].topic, "sensors/a");
    ASSERT_EQ(reports_.size(), 3u);
    EXPECT_FALSE(reports_[0].delivered);
    EXPECT_EQ(reports_[0].attempts, 1);
    EXPECT_TRUE(reports_[1].delivered);
    EXPECT_TRUE(reports_[2].delivered);
}

TEST_F(TelemetryPublisherTest, ErrorSinkMayCloseOnFinalAckTimeout) {
    createClosingOnFailure();
    transport_->setHoldAcks(true);
    publisher_->publish("sensors/a", "1", QoS::AtLeastOnce);
    publisher_->publish("sensors/b", "2", QoS::AtLeastOnce);
    publisher_->processEvents();
    ASSERT_EQ(publisher_->inflightCount(), 2u);

    clock_->advance(1000ms);
    tick();

    EXPECT_TRUE(publisher_->isClosed());
    EXPECT_EQ(publisher_->size(), 0u);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].topic, "sensors/a");
    ASSERT_EQ(reports_.size(), 2u);
    EXPECT_FALSE(reports_[0].delivered);
    EXPECT_EQ(reports_[1].topic, "sensors/b");

    transport_->ackAll(true);
    tick();
    EXPECT_EQ(reports_.size(), 2u);
}

TEST_F(TelemetryPublisherTest, RejectsWildcardTopic) {
    EXPECT_EQ(publisher_->publish("sensors/+", "v", QoS::AtLeastOnce).status, ErrorCode::InvalidArgument);
    EXPECT_EQ(publisher_->publish("", "v", QoS::AtLeastOnce).status, ErrorCode::InvalidArgument);
}
