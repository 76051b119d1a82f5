#include "SubscriptionRouter.hpp"
#include "../TopicFilter.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace iotagent::domain {

SubscriptionRouter::SubscriptionRouter(std::shared_ptr<ports::ITransport> transport)
    : transport_(std::move(transport)) {
}

SubscriptionId SubscriptionRouter::subscribe(const std::string& pattern,
                                             std::shared_ptr<ports::IMessageHandler> handler,
                                             QoS qos) {
    if (!TopicFilter::isValidFilter(pattern)) {
        throw std::invalid_argument("Invalid topic filter: '" + pattern + "'");
    }
    if (!handler) {
        throw std::invalid_argument("Null handler for topic filter: '" + pattern + "'");
    }

    auto entry = std::make_shared<Entry>();
    entry->id = nextId_++;
    entry->pattern = pattern;
    entry->handler = std::move(handler);
    entry->qos = qos;
    entries_[entry->id] = entry;

    auto& state = patterns_[pattern];
    state.references++;
    if (qosToInt(qos) > qosToInt(state.qos)) {
        state.qos = qos;
    }

    if (connected_ && (!state.issued || qosToInt(state.qos) > qosToInt(state.issuedQos))) {
        issue(pattern, state);
    }
    return entry->id;
}

bool SubscriptionRouter::unsubscribe(SubscriptionId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }

    auto entry = it->second;
    entry->active = false;
    entries_.erase(it);

    auto patternIt = patterns_.find(entry->pattern);
    if (patternIt == patterns_.end()) {
        return true;
    }

    auto& state = patternIt->second;
    if (--state.references > 0) {
        // Level used on the next replay follows the remaining subscribers
        state.qos = QoS::AtMostOnce;
        for (const auto& [otherId, other] : entries_) {
            if (other->pattern == entry->pattern && qosToInt(other->qos) > qosToInt(state.qos)) {
                state.qos = other->qos;
            }
        }
        return true;
    }

    bool wasIssued = state.issued;
    patterns_.erase(patternIt);
    if (connected_ && wasIssued && !transport_->unsubscribe(entry->pattern)) {
        std::cerr << "[Router] Transport unsubscribe failed for " << entry->pattern << std::endl;
    }
    return true;
}

void SubscriptionRouter::issue(const std::string& pattern, PatternState& state) {
    std::uint64_t seq = ++state.issueSeq;
    std::weak_ptr<SubscriptionRouter> weak = weak_from_this();
    bool accepted = transport_->subscribe(pattern, qosToInt(state.qos),
        [weak, pattern, seq](bool granted, std::string_view reason) {
            if (auto self = weak.lock()) {
                self->onSubscribeResult(pattern, seq, granted, std::string(reason));
            }
        });

    if (accepted) {
        state.issued = true;
        state.issuedQos = state.qos;
    } else {
        state.issued = false;
        std::cerr << "[Router] Transport subscribe failed for " << pattern
                  << ", retrying on next connect" << std::endl;
    }
}

void SubscriptionRouter::onSubscribeResult(const std::string& pattern, std::uint64_t seq, bool granted,
                                           const std::string& reason) {
    auto it = patterns_.find(pattern);
    if (granted || !connected_ || it == patterns_.end() || it->second.issueSeq != seq) {
        return;
    }

    it->second.issued = false;
    std::cerr << "[Router] Broker refused " << pattern << ", retrying on next connect" << std::endl;
    report(ErrorCode::Subscription, "subscription refused: " + reason, pattern);
}

void SubscriptionRouter::onConnected() {
    connected_ = true;
    for (auto& [pattern, state] : patterns_) {
        issue(pattern, state);
    }
    if (!patterns_.empty()) {
        std::cout << "[Router] Re-issued " << patterns_.size() << " subscription(s)" << std::endl;
    }
}

void SubscriptionRouter::onDisconnected() {
    connected_ = false;
    for (auto& entry : patterns_) {
        entry.second.issued = false;
    }
}

void SubscriptionRouter::clear() {
    for (auto& entry : entries_) {
        entry.second->active = false;
    }
    entries_.clear();
    patterns_.clear();
    queues_.clear();
    readyTopics_.clear();
}

void SubscriptionRouter::onMessage(std::string_view topic, std::string_view payload) {
    Message message;
    message.topic = std::string(topic);
    message.payload = std::string(payload);
    message.correlationId = TopicFilter::extractRequestId(topic);

    auto& queue = queues_[message.topic];
    if (queue.empty()) {
        readyTopics_.push_back(message.topic);
    }
    queue.push_back(std::move(message));
}

void SubscriptionRouter::dispatchPending() {
    if (dispatching_) {
        return;
    }
    dispatching_ = true;

    while (!readyTopics_.empty()) {
        // One message per topic per round
        std::size_t round = readyTopics_.size();
        for (std::size_t i = 0; i < round && !readyTopics_.empty(); ++i) {
            std::string topic = std::move(readyTopics_.front());
            readyTopics_.pop_front();

            auto queueIt = queues_.find(topic);
            if (queueIt == queues_.end() || queueIt->second.empty()) {
                continue;
            }

            Message message = std::move(queueIt->second.front());
            queueIt->second.pop_front();
            if (queueIt->second.empty()) {
                queues_.erase(queueIt);
            } else {
                readyTopics_.push_back(topic);
            }

            dispatch(message);
        }
    }

    dispatching_ = false;
}

void SubscriptionRouter::dispatch(const Message& message) {
    std::vector<std::shared_ptr<Entry>> targets;
    for (const auto& [id, entry] : entries_) {
        if (TopicFilter::matches(entry->pattern, message.topic)) {
            targets.push_back(entry);
        }
    }

    for (const auto& entry : targets) {
        // Removed by an earlier handler in this round
        if (!entry->active) {
            continue;
        }

        Message delivered = message;
        delivered.qos = entry->qos;

        try {
            entry->handler->onMessage(delivered);
        } catch (const std::exception& e) {
            report(ErrorCode::HandlerFailure, e.what(), message.topic);
        } catch (...) {
            report(ErrorCode::HandlerFailure, "non-standard exception", message.topic);
        }
    }
}

std::size_t SubscriptionRouter::queuedCount() const {
    std::size_t total = 0;
    for (const auto& entry : queues_) {
        total += entry.second.size();
    }
    return total;
}

void SubscriptionRouter::report(ErrorCode code, const std::string& message, const std::string& topic) {
    AgentError error{code, message, topic};
    if (errorSink_) {
        errorSink_(error);
    } else {
        logError(error);
    }
}

} // namespace iotagent::domain
