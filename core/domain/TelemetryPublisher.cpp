#include "TelemetryPublisher.hpp"
#include "../TopicFilter.hpp"
#include <iostream>
#include <unordered_set>

namespace iotagent::domain {

TelemetryPublisher::TelemetryPublisher(std::shared_ptr<ports::ITransport> transport,
                                       std::shared_ptr<IClock> clock,
                                       std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                       std::size_t capacity,
                                       std::size_t maxInflight)
    : transport_(std::move(transport)),
      clock_(std::move(clock)),
      policyEngine_(std::move(policyEngine)),
      capacity_(capacity),
      maxInflight_(maxInflight) {
}

PublishResult TelemetryPublisher::publish(const std::string& topic, const std::string& payload, QoS qos) {
    if (closed_) {
        return {ErrorCode::Closed, 0};
    }
    if (!TopicFilter::isValidTopicName(topic)) {
        return {ErrorCode::InvalidArgument, 0};
    }
    if (jobs_.size() >= capacity_) {
        std::cerr << "[Publisher] Queue full (" << capacity_ << "), rejecting publish to " << topic << std::endl;
        return {ErrorCode::Backpressure, 0};
    }

    PublishJob job;
    job.id = nextJobId_++;
    job.topic = topic;
    job.payload = payload;
    job.qos = qos;
    job.enqueuedAt = clock_->now();
    job.notBefore = job.enqueuedAt;
    jobs_.push_back(std::move(job));

    return {ErrorCode::None, jobs_.back().id};
}

void TelemetryPublisher::onSessionEstablished() {
    active_ = true;
}

void TelemetryPublisher::onSessionLost() {
    active_ = false;
    for (auto& job : jobs_) {
        job.inFlight = false;
    }
    if (inflight_ > 0) {
        std::cout << "[Publisher] Session lost, " << inflight_ << " in-flight job(s) back to pending" << std::endl;
    }
    inflight_ = 0;
}

void TelemetryPublisher::processEvents() {
    if (!active_ || closed_) {
        return;
    }

    auto now = clock_->now();
    // A delivery listener may close the publisher mid-loop
    for (auto it = jobs_.begin(); !closed_ && it != jobs_.end();) {
        if (it->inFlight && it->ackDeadline <= now) {
            it->inFlight = false;
            --inflight_;
            it = failAttempt(it, "ack timeout");
        } else {
            ++it;
        }
    }

    if (!closed_) {
        drain();
    }
}

void TelemetryPublisher::drain() {
    auto now = clock_->now();
    std::unordered_set<std::string> headsSeen;

    for (auto it = jobs_.begin(); !closed_ && active_ && it != jobs_.end();) {
        // Only the oldest job of each topic may go out
        if (!headsSeen.insert(it->topic).second || it->inFlight || it->notBefore > now) {
            ++it;
            continue;
        }
        if (inflight_ >= maxInflight_) {
            break;
        }
        it = send(it);
    }
}

TelemetryPublisher::JobIterator TelemetryPublisher::send(JobIterator job) {
    std::uint64_t seq = nextSeq_++;
    job->sendSeq = seq;

    if (job->qos == QoS::AtMostOnce) {
        if (transport_->publish(job->topic, job->payload, 0, nullptr)) {
            return finish(job, true, "handed to transport");
        }
        return failAttempt(job, "rejected by transport");
    }

    job->inFlight = true;
    job->ackDeadline = clock_->now() + policyEngine_->getDeliveryPolicy().getAckTimeout();
    ++inflight_;

    std::weak_ptr<TelemetryPublisher> weak = weak_from_this();
    std::uint64_t jobId = job->id;
    bool accepted = transport_->publish(job->topic, job->payload, qosToInt(job->qos),
        [weak, jobId, seq](bool delivered, std::string_view reason) {
            if (auto self = weak.lock()) {
                self->onDelivery(jobId, seq, delivered, std::string(reason));
            }
        });

    if (!accepted) {
        job->inFlight = false;
        --inflight_;
        return failAttempt(job, "rejected by transport");
    }
    return std::next(job);
}

void TelemetryPublisher::onDelivery(std::uint64_t jobId, std::uint64_t seq, bool delivered,
                                    const std::string& reason) {
    for (auto it = jobs_.begin(); it != jobs_.end(); ++it) {
        if (it->id != jobId) {
            continue;
        }
        // Ack for an attempt that already timed out or was reset by a session loss
        if (!it->inFlight || it->sendSeq != seq) {
            return;
        }
        it->inFlight = false;
        --inflight_;
        if (delivered) {
            finish(it, true, reason);
        } else {
            failAttempt(it, reason);
        }
        return;
    }
}

TelemetryPublisher::JobIterator TelemetryPublisher::failAttempt(JobIterator job, const std::string& reason) {
    job->failures++;
    const auto& policy = policyEngine_->getDeliveryPolicy();

    if (policy.shouldRetry(job->failures)) {
        auto delay = policy.getRetryDelay(job->failures);
        job->notBefore = clock_->now() + delay;
        std::cerr << "[Publisher] Job " << job->id << " to " << job->topic << " failed (" << reason
                  << "), retry " << job->failures << " in " << delay.count() << "ms" << std::endl;
        return std::next(job);
    }

    std::string message = "dropped after " + std::to_string(job->failures) + " failed attempt(s): " + reason;
    AgentError error{ErrorCode::DeliveryFailure, message, job->topic};

    // The job is gone before any callback runs; callers re-check closed_
    auto next = finish(job, false, message);
    report(error);
    return next;
}

void TelemetryPublisher::report(const AgentError& error) {
    if (errorSink_) {
        errorSink_(error);
    } else {
        logError(error);
    }
}

TelemetryPublisher::JobIterator TelemetryPublisher::finish(JobIterator job, bool delivered,
                                                           const std::string& message) {
    DeliveryReport report;
    report.jobId = job->id;
    report.topic = job->topic;
    report.delivered = delivered;
    report.attempts = job->failures + (delivered ? 1 : 0);
    report.message = message;

    auto next = jobs_.erase(job);
    if (deliveryListener_) {
        deliveryListener_(report);
    }
    return next;
}

void TelemetryPublisher::drainForShutdown() {
    if (closed_) {
        return;
    }
    closed_ = true;

    std::size_t handedOff = 0;
    std::size_t abandoned = 0;

    while (!jobs_.empty()) {
        auto job = jobs_.begin();
        bool delivered = false;
        std::string message;

        if (active_ && job->inFlight) {
            delivered = true;
            message = "in flight at shutdown, unconfirmed";
        } else if (active_ && transport_->publish(job->topic, job->payload, qosToInt(job->qos), nullptr)) {
            delivered = true;
            message = "handed to transport at shutdown, unconfirmed";
        } else {
            message = "agent closed before delivery";
        }

        std::string topic = job->topic;
        finish(job, delivered, message);
        if (delivered) {
            ++handedOff;
        } else {
            ++abandoned;
            report(AgentError{ErrorCode::DeliveryFailure, message, topic});
        }
    }
    inflight_ = 0;

    std::cout << "[Publisher] Closed: " << handedOff << " job(s) handed off, "
              << abandoned << " abandoned" << std::endl;
}

} // namespace iotagent::domain
