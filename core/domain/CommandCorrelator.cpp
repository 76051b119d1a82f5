#include "CommandCorrelator.hpp"
#include "../TopicFilter.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace iotagent::domain {

namespace {

constexpr int kMaxIdAttempts = 8;

} // namespace

CommandCorrelator::CommandCorrelator(std::shared_ptr<ports::ITransport> transport,
                                     std::shared_ptr<IClock> clock,
                                     std::shared_ptr<IIdGenerator> idGenerator,
                                     std::chrono::milliseconds defaultTimeout,
                                     std::string responseTopic)
    : transport_(std::move(transport)),
      clock_(std::move(clock)),
      idGenerator_(std::move(idGenerator)),
      defaultTimeout_(defaultTimeout),
      responseTopic_(std::move(responseTopic)) {
}

std::string CommandCorrelator::newId() {
    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        std::string id = idGenerator_->next();
        if (!id.empty() && pending_.count(id) == 0) {
            return id;
        }
    }
    throw std::runtime_error("Unable to generate a unique correlation id");
}

std::string CommandCorrelator::call(const std::string& topic, const std::string& payload,
                                    CallCallback callback,
                                    std::optional<std::chrono::milliseconds> timeout) {
    if (!TopicFilter::isValidTopicName(topic)) {
        throw std::invalid_argument("Invalid request topic: '" + topic + "'");
    }
    if (!callback) {
        throw std::invalid_argument("Call on '" + topic + "' needs a completion callback");
    }

    if (closed_) {
        invoke(callback, CallResult{"", ErrorCode::Closed, "", "", "agent is closed"});
        return "";
    }
    if (!active_) {
        invoke(callback, CallResult{"", ErrorCode::SessionLost, "", "", "session not connected"});
        return "";
    }

    std::string id = newId();
    auto deadline = clock_->now() + timeout.value_or(defaultTimeout_);
    pending_[id] = PendingCall{topic, deadline, std::move(callback)};

    std::weak_ptr<CommandCorrelator> weak = weak_from_this();
    bool accepted = transport_->publish(TopicFilter::withRequestId(topic, id), payload,
        qosToInt(QoS::AtLeastOnce),
        [weak, id](bool delivered, std::string_view reason) {
            if (auto self = weak.lock()) {
                self->onRequestDelivery(id, delivered, std::string(reason));
            }
        });

    if (!accepted) {
        auto it = pending_.find(id);
        CallCallback failed = std::move(it->second.callback);
        pending_.erase(it);
        invoke(failed, CallResult{"", ErrorCode::SessionLost, "", "", "request rejected by transport"});
        return "";
    }
    return id;
}

bool CommandCorrelator::cancel(const std::string& id) {
    if (pending_.count(id) == 0) {
        return false;
    }
    complete(id, ErrorCode::Cancelled, "", "cancelled");
    return true;
}

void CommandCorrelator::onResponse(const Message& message) {
    auto id = message.correlationId ? message.correlationId : TopicFilter::extractRequestId(message.topic);
    if (!id) {
        std::cerr << "[Correlator] Response without request id on " << message.topic << std::endl;
        return;
    }

    auto it = pending_.find(*id);
    if (it == pending_.end()) {
        // Late answer to a call that already completed
        return;
    }

    CallCallback callback = std::move(it->second.callback);
    pending_.erase(it);
    invoke(callback, CallResult{*id, ErrorCode::None, message.payload, message.topic, ""});
}

void CommandCorrelator::onRequestDelivery(const std::string& id, bool delivered, const std::string& reason) {
    if (!delivered && pending_.count(id) > 0) {
        complete(id, ErrorCode::DeliveryFailure, "", "request not delivered: " + reason);
    }
}

void CommandCorrelator::checkTimeouts() {
    auto now = clock_->now();

    std::vector<std::string> expired;
    for (const auto& [id, call] : pending_) {
        if (call.deadline <= now) {
            expired.push_back(id);
        }
    }

    for (const auto& id : expired) {
        // A callback of an earlier expiry may have cancelled this one
        if (pending_.count(id) > 0) {
            complete(id, ErrorCode::Timeout, "", "no response before deadline");
        }
    }
}

void CommandCorrelator::failAll(ErrorCode code, const std::string& reason) {
    if (pending_.empty()) {
        return;
    }
    std::cout << "[Correlator] Failing " << pending_.size() << " pending call(s): " << reason << std::endl;

    auto calls = std::move(pending_);
    pending_.clear();
    for (auto& [id, call] : calls) {
        invoke(call.callback, CallResult{id, code, "", "", reason});
    }
}

void CommandCorrelator::complete(const std::string& id, ErrorCode status, const std::string& payload,
                                 const std::string& detail) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }
    CallCallback callback = std::move(it->second.callback);
    pending_.erase(it);
    invoke(callback, CallResult{id, status, payload, "", detail});
}

void CommandCorrelator::invoke(const CallCallback& callback, const CallResult& result) {
    try {
        callback(result);
    } catch (const std::exception& e) {
        AgentError error{ErrorCode::HandlerFailure, std::string("call callback threw: ") + e.what(), ""};
        if (errorSink_) {
            errorSink_(error);
        } else {
            logError(error);
        }
    }
}

} // namespace iotagent::domain
