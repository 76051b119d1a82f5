#include <gtest/gtest.h>
#include "../core/domain/SubscriptionRouter.hpp"
#include "../core/sim/MockTransport.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace iotagent;

class SubscriptionRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<sim::MockTransport>();
        router_ = std::make_shared<domain::SubscriptionRouter>(transport_);
        router_->setErrorSink([this](const AgentError& error) {
            errors_.push_back(error);
        });
    }

    void connect() {
        transport_->connect(ports::Credentials{});
        transport_->processEvents();
        router_->onConnected();
    }

    domain::SubscriptionId record(const std::string& pattern, const std::string& label) {
        return router_->subscribe(pattern, ports::makeHandler([this, label](const Message& message) {
            received_.push_back(label + ":" + message.payload);
        }));
    }

    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<domain::SubscriptionRouter> router_;
    std::vector<AgentError> errors_;
    std::vector<std::string> received_;
};

TEST_F(SubscriptionRouterTest, SubscriptionDeferredUntilConnected) {
    record("sensors/1", "h");
    EXPECT_TRUE(transport_->subscriptions().empty());

    connect();
    EXPECT_EQ(transport_->subscriptions().count("sensors/1"), 1u);
}

TEST_F(SubscriptionRouterTest, ReplayedOnEveryConnect) {
    record("sensors/1", "h");
    connect();

    transport_->simulateConnectionLoss();
    transport_->processEvents();
    router_->onDisconnected();
    EXPECT_TRUE(transport_->subscriptions().empty());

    connect();
    EXPECT_EQ(transport_->subscriptions().count("sensors/1"), 1u);
}

TEST_F(SubscriptionRouterTest, SharedPatternUsesOneTransportSubscription) {
    connect();

    auto first = record("sensors/+", "a");
    auto second = record("sensors/+", "b");
    EXPECT_EQ(transport_->subscribeCalls(), 1);
    EXPECT_EQ(router_->patternCount(), 1u);

    EXPECT_TRUE(router_->unsubscribe(first));
    EXPECT_EQ(transport_->subscriptions().count("sensors/+"), 1u);

    EXPECT_TRUE(router_->unsubscribe(second));
    EXPECT_TRUE(transport_->subscriptions().empty());
    EXPECT_EQ(router_->patternCount(), 0u);

    EXPECT_FALSE(router_->unsubscribe(second));
}

TEST_F(SubscriptionRouterTest, HigherLevelResubscribes) {
    connect();

    router_->subscribe("alerts/#", ports::makeHandler([](const Message&) {}), QoS::AtMostOnce);
    router_->subscribe("alerts/#", ports::makeHandler([](const Message&) {}), QoS::ExactlyOnce);
    EXPECT_EQ(transport_->subscribeCalls(), 2);

    router_->subscribe("alerts/#", ports::makeHandler([](const Message&) {}), QoS::AtLeastOnce);
    EXPECT_EQ(transport_->subscribeCalls(), 2);
}

TEST_F(SubscriptionRouterTest, PerTopicOrderIsArrivalOrder) {
    record("sensors/1", "h");

    for (int i = 0; i < 5; ++i) {
        router_->onMessage("sensors/1", std::to_string(i));
    }
    router_->dispatchPending();

    std::vector<std::string> expected = {"h:0", "h:1", "h:2", "h:3", "h:4"};
    EXPECT_EQ(received_, expected);
    EXPECT_EQ(router_->queuedCount(), 0u);
}

TEST_F(SubscriptionRouterTest, BusyTopicDoesNotStarveOthers) {
    record("#", "h");

    router_->onMessage("busy", "b1");
    router_->onMessage("busy", "b2");
    router_->onMessage("busy", "b3");
    router_->onMessage("quiet", "q1");
    router_->dispatchPending();

    std::vector<std::string> expected = {"h:b1", "h:q1", "h:b2", "h:b3"};
    EXPECT_EQ(received_, expected);
}

TEST_F(SubscriptionRouterTest, EveryMatchingHandlerInRegistrationOrder) {
    record("sensors/+/temp", "plus");
    record("sensors/#", "hash");
    record("sensors/7/temp", "exact");
    record("actuators/#", "other");

    router_->onMessage("sensors/7/temp", "21");
    router_->dispatchPending();

    std::vector<std::string> expected = {"plus:21", "hash:21", "exact:21"};
    EXPECT_EQ(received_, expected);
}

TEST_F(SubscriptionRouterTest, ThrowingHandlerIsIsolated) {
    router_->subscribe("sensors/1", ports::makeHandler([](const Message&) {
        throw std::runtime_error("handler exploded");
    }));
    record("sensors/1", "after");

    router_->onMessage("sensors/1", "x");
    router_->onMessage("sensors/1", "y");
    router_->dispatchPending();

    std::vector<std::string> expected = {"after:x", "after:y"};
    EXPECT_EQ(received_, expected);
    ASSERT_EQ(errors_.size(), 2u);
    EXPECT_EQ(errors_[0].code, ErrorCode::HandlerFailure);
    EXPECT_EQ(errors_[0].topic, "sensors/1");
    EXPECT_EQ(errors_[0].message, "handler exploded");
}

TEST_F(SubscriptionRouterTest, InvalidRegistrationsAreRejected) {
    EXPECT_THROW(record("sensors/#/temp", "h"), std::invalid_argument);
    EXPECT_THROW(record("", "h"), std::invalid_argument);
    EXPECT_THROW(router_->subscribe("sensors/1", nullptr), std::invalid_argument);
    EXPECT_EQ(router_->subscriptionCount(), 0u);
}

TEST_F(SubscriptionRouterTest, HandlerRemovedMidDispatchIsNotInvoked) {
    domain::SubscriptionId victim = 0;
    router_->subscribe("t", ports::makeHandler([this, &victim](const Message&) {
        received_.push_back("first");
        router_->unsubscribe(victim);
    }));
    victim = record("t", "victim");

    router_->onMessage("t", "1");
    router_->dispatchPending();

    std::vector<std::string> expected = {"first"};
    EXPECT_EQ(received_, expected);
}

TEST_F(SubscriptionRouterTest, NestedDispatchKeepsOrder) {
    router_->subscribe("t", ports::makeHandler([this](const Message& message) {
        received_.push_back(message.payload);
        // Re-entrant dispatch from a handler is a no-op
        router_->dispatchPending();
    }));

    router_->onMessage("t", "1");
    router_->onMessage("t", "2");
    router_->dispatchPending();

    std::vector<std::string> expected = {"1", "2"};
    EXPECT_EQ(received_, expected);
}

TEST_F(SubscriptionRouterTest, CorrelationIdTakenFromTopic) {
    std::optional<std::string> seen;
    router_->subscribe("rpc/#", ports::makeHandler([&seen](const Message& message) {
        seen = message.correlationId;
    }));

    router_->onMessage("rpc/res/200/?$rid=abc", "{}");
    router_->dispatchPending();

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, "abc");
}

TEST_F(SubscriptionRouterTest, ClearDropsSubscriptionsAndQueuedMessages) {
    record("t", "h");
    router_->onMessage("t", "1");

    router_->clear();
    router_->dispatchPending();

    EXPECT_TRUE(received_.empty());
    EXPECT_EQ(router_->subscriptionCount(), 0u);
    EXPECT_EQ(router_->queuedCount(), 0u);
}

TEST_F(SubscriptionRouterTest, RefusedSubscriptionIsReportedAndReissuedOnConnect) {
    record("secure/#", "h");
    transport_->refuseSubscription("secure/#");
    connect();
    transport_->processEvents();

    EXPECT_EQ(transport_->subscriptions().count("secure/#"), 0u);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, ErrorCode::Subscription);
    EXPECT_EQ(errors_[0].topic, "secure/#");

    transport_->allowSubscription("secure/#");
    transport_->simulateConnectionLoss();
    transport_->processEvents();
    router_->onDisconnected();
    connect();
    transport_->processEvents();

    EXPECT_EQ(transport_->subscriptions().count("secure/#"), 1u);
    EXPECT_EQ(transport_->subscribeCalls(), 2);
    EXPECT_EQ(errors_.size(), 1u);
}

TEST_F(SubscriptionRouterTest, NewHandlerOnRefusedFilterIssuesAgain) {
    record("secure/#", "first");
    transport_->refuseSubscription("secure/#");
    connect();
    transport_->processEvents();
    ASSERT_EQ(errors_.size(), 1u);

    transport_->allowSubscription("secure/#");
    record("secure/#", "second");

    EXPECT_EQ(transport_->subscriptions().count("secure/#"), 1u);
    EXPECT_EQ(transport_->subscribeCalls(), 2);
}

TEST_F(SubscriptionRouterTest, RefusalArrivingAfterDisconnectIsIgnored) {
    record("secure/#", "h");
    transport_->refuseSubscription("secure/#");
    connect();

    router_->onDisconnected();
    transport_->processEvents();

    EXPECT_TRUE(errors_.empty());
}
