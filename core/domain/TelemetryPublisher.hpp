#pragma once

#include "../Errors.hpp"
#include "../IClock.hpp"
#include "../Message.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/ITransport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <string>

namespace iotagent::domain {

struct PublishJob {
    std::uint64_t id = 0;
    std::string topic;
    std::string payload;
    QoS qos = QoS::AtLeastOnce;
    int failures = 0;
    std::chrono::steady_clock::time_point enqueuedAt;
    std::chrono::steady_clock::time_point notBefore;
    std::chrono::steady_clock::time_point ackDeadline;
    std::uint64_t sendSeq = 0;
    bool inFlight = false;
};

struct PublishResult {
    ErrorCode status = ErrorCode::None;   ///< None, Backpressure, Closed or InvalidArgument
    std::uint64_t jobId = 0;

    bool ok() const { return status == ErrorCode::None; }
};

struct DeliveryReport {
    std::uint64_t jobId = 0;
    std::string topic;
    bool delivered = false;
    int attempts = 0;
    std::string message;
};

// Bounded outbound queue with ack tracking and retries. Jobs leave the
// queue in enqueue order; a topic has at most one job in flight.
class TelemetryPublisher : public std::enable_shared_from_this<TelemetryPublisher> {
public:
    using DeliveryListener = std::function<void(const DeliveryReport&)>;

    TelemetryPublisher(std::shared_ptr<ports::ITransport> transport,
                       std::shared_ptr<IClock> clock,
                       std::shared_ptr<ports::IPolicyEngine> policyEngine,
                       std::size_t capacity,
                       std::size_t maxInflight);

    PublishResult publish(const std::string& topic, const std::string& payload, QoS qos);

    /// Ack timeouts, then hand eligible jobs to the transport
    void processEvents();

    void onSessionEstablished();
    /// In-flight jobs go back to pending without counting as failures
    void onSessionLost();

    /**
     * @brief Final flush before the agent closes
     *
     * While connected, every job not yet in flight is handed to the transport
     * once; jobs in the transport's hands are reported delivered (unconfirmed).
     * Everything else is reported as a failure. Later publishes return Closed.
     */
    void drainForShutdown();

    void setDeliveryListener(DeliveryListener listener) { deliveryListener_ = std::move(listener); }
    void setErrorSink(ErrorSink sink) { errorSink_ = std::move(sink); }

    std::size_t size() const { return jobs_.size(); }
    std::size_t inflightCount() const { return inflight_; }
    std::size_t queuedCount() const { return jobs_.size() - inflight_; }
    std::size_t capacity() const { return capacity_; }
    bool isClosed() const { return closed_; }

private:
    using JobIterator = std::list<PublishJob>::iterator;

    void drain();
    JobIterator send(JobIterator job);
    JobIterator failAttempt(JobIterator job, const std::string& reason);
    JobIterator finish(JobIterator job, bool delivered, const std::string& message);
    void report(const AgentError& error);
    void onDelivery(std::uint64_t jobId, std::uint64_t seq, bool delivered, const std::string& reason);

    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::size_t capacity_;
    std::size_t maxInflight_;

    std::list<PublishJob> jobs_;    // enqueue order, pending and in flight
    std::size_t inflight_ = 0;
    std::uint64_t nextJobId_ = 1;
    std::uint64_t nextSeq_ = 1;
    bool active_ = false;
    bool closed_ = false;

    DeliveryListener deliveryListener_;
    ErrorSink errorSink_;
};

} // namespace iotagent::domain
