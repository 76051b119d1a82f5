#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "../core/domain/CommandCorrelator.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <vector>

using namespace iotagent;
using namespace std::chrono_literals;

class CommandCorrelatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->freezeTime();
        transport_ = std::make_shared<sim::MockTransport>();
        ids_ = std::make_shared<iotagent::testing::SequentialIdGenerator>();
        correlator_ = std::make_shared<domain::CommandCorrelator>(
            transport_, clock_, ids_, 5000ms, "iot/rpc/dev-1/res");
        correlator_->setErrorSink([this](const AgentError& error) { errors_.push_back(error); });

        transport_->connect(ports::Credentials{});
        transport_->processEvents();
        correlator_->setSessionActive(true);
    }

    domain::CommandCorrelator::CallCallback collect() {
        return [this](const domain::CallResult& result) { results_.push_back(result); };
    }

    Message response(const std::string& id, const std::string& payload) {
        Message message;
        message.topic = "iot/rpc/dev-1/res/200/?$rid=" + id;
        message.payload = payload;
        return message;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::shared_ptr<iotagent::testing::SequentialIdGenerator> ids_;
    std::shared_ptr<domain::CommandCorrelator> correlator_;
    std::vector<domain::CallResult> results_;
    std::vector<AgentError> errors_;
};

TEST_F(CommandCorrelatorTest, RequestCarriesIdInTopicAndPayloadUnchanged) {
    auto id = correlator_->call("cmd/reboot", "{\"delay\": 5}", collect());

    EXPECT_EQ(id, "id-1");
    ASSERT_EQ(transport_->getPublishedMessages().size(), 1u);
    const auto& request = transport_->getPublishedMessages()[0];
    EXPECT_EQ(request.topic, "cmd/reboot/?$rid=id-1");
    EXPECT_EQ(request.payload, "{\"delay\": 5}");
    EXPECT_EQ(request.qos, 1);
    EXPECT_EQ(correlator_->responseFilter(), "iot/rpc/dev-1/res/#");
}

TEST_F(CommandCorrelatorTest, ResponseResolvesMatchingCall) {
    auto first = correlator_->call("cmd/a", "{}", collect());
    auto second = correlator_->call("cmd/b", "{}", collect());

    correlator_->onResponse(response(second, "{\"ok\":true}"));

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_TRUE(results_[0].ok());
    EXPECT_EQ(results_[0].id, second);
    EXPECT_EQ(results_[0].payload, "{\"ok\":true}");
    EXPECT_TRUE(correlator_->isPending(first));
    EXPECT_FALSE(correlator_->isPending(second));
}

TEST_F(CommandCorrelatorTest, TimesOutExactlyAtDeadline) {
    correlator_->call("cmd/reboot", "{}", collect(), 2000ms);

    clock_->advance(1999ms);
    correlator_->checkTimeouts();
    EXPECT_TRUE(results_.empty());

    clock_->advance(1ms);
    correlator_->checkTimeouts();
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].status, ErrorCode::Timeout);

    correlator_->checkTimeouts();
    EXPECT_EQ(results_.size(), 1u);
    EXPECT_EQ(correlator_->pendingCount(), 0u);
}

TEST_F(CommandCorrelatorTest, DefaultTimeoutApplies) {
    correlator_->call("cmd/reboot", "{}", collect());

    clock_->advance(4999ms);
    correlator_->checkTimeouts();
    EXPECT_TRUE(results_.empty());

    clock_->advance(1ms);
    correlator_->checkTimeouts();
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].status, ErrorCode::Timeout);
}

TEST_F(CommandCorrelatorTest, CancelCompletesOnceAndLateResponseIsDiscarded) {
    auto id = correlator_->call("cmd/reboot", "{}", collect());

    EXPECT_TRUE(correlator_->cancel(id));
    EXPECT_FALSE(correlator_->cancel(id));
    correlator_->onResponse(response(id, "late"));

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].status, ErrorCode::Cancelled);
}

TEST_F(CommandCorrelatorTest, FailsFastWhenSessionNotConnected) {
    correlator_->setSessionActive(false);

    auto id = correlator_->call("cmd/reboot", "{}", collect());

    EXPECT_TRUE(id.empty());
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].status, ErrorCode::SessionLost);
    EXPECT_TRUE(transport_->getPublishedMessages().empty());
}

TEST_F(CommandCorrelatorTest, TransportRejectionFailsFast) {
    transport_->setFailPublish(true);

    auto id = correlator_->call("cmd/reboot", "{}", collect());

    EXPECT_TRUE(id.empty());
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].status, ErrorCode::SessionLost);
    EXPECT_EQ(correlator_->pendingCount(), 0u);
}

TEST_F(CommandCorrelatorTest, NegativeAckFailsCall) {
    transport_->setHoldAcks(true);
    correlator_->call("cmd/reboot", "{}", collect());

    transport_->ackNext(false);
    transport_->processEvents();

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].status, ErrorCode::DeliveryFailure);
}

TEST_F(CommandCorrelatorTest, SessionLossFailsEveryPendingCall) {
    correlator_->call("cmd/a", "{}", collect());
    correlator_->call("cmd/b", "{}", collect());

    correlator_->failAll(ErrorCode::SessionLost, "connection lost");

    ASSERT_EQ(results_.size(), 2u);
    for (const auto& result : results_) {
        EXPECT_EQ(result.status, ErrorCode::SessionLost);
        EXPECT_EQ(result.errorMessage, "connection lost");
    }
    EXPECT_EQ(correlator_->pendingCount(), 0u);
}

TEST_F(CommandCorrelatorTest, CollidingIdIsRegenerated) {
    ids_->script("dup");
    ids_->script("dup");
    ids_->script("fresh");

    auto first = correlator_->call("cmd/a", "{}", collect());
    auto second = correlator_->call("cmd/b", "{}", collect());

    EXPECT_EQ(first, "dup");
    EXPECT_EQ(second, "fresh");
    EXPECT_EQ(correlator_->pendingCount(), 2u);
}

TEST_F(CommandCorrelatorTest, ClosedCorrelatorRejectsCalls) {
    correlator_->close();

    auto id = correlator_->call("cmd/a", "{}", collect());

    EXPECT_TRUE(id.empty());
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].status, ErrorCode::Closed);
}

TEST_F(CommandCorrelatorTest, ThrowingCallbackIsReported) {
    auto id = correlator_->call("cmd/a", "{}", [](const domain::CallResult&) {
        throw std::runtime_error("bad callback");
    });

    correlator_->onResponse(response(id, "{}"));

    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, ErrorCode::HandlerFailure);
    EXPECT_EQ(correlator_->pendingCount(), 0u);
}

TEST_F(CommandCorrelatorTest, InvalidArgumentsThrow) {
    EXPECT_THROW(correlator_->call("cmd/+", "{}", collect()), std::invalid_argument);
    EXPECT_THROW(correlator_->call("cmd/a", "{}", nullptr), std::invalid_argument);
}
