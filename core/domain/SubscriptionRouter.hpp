#pragma once

#include "../Errors.hpp"
#include "../Message.hpp"
#include "../ports/IMessageHandler.hpp"
#include "../ports/ITransport.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace iotagent::domain {

using SubscriptionId = std::uint64_t;

/**
 * @brief Topic pattern to handler table with per-topic ordered dispatch
 *
 * Inbound messages are queued per concrete topic and dispatched from
 * dispatchPending() one message per topic per round. Every matching handler
 * runs, in registration order. Patterns that share a filter share one
 * transport subscription at the highest requested level. A filter the
 * broker refuses is reported and issued again on the next connect.
 */
class SubscriptionRouter : public std::enable_shared_from_this<SubscriptionRouter> {
public:
    explicit SubscriptionRouter(std::shared_ptr<ports::ITransport> transport);

    /**
     * @brief Register a handler for a topic filter
     * @return Id for unsubscribe()
     * @throws std::invalid_argument for an invalid filter or a null handler
     * @note The transport subscription is deferred until the session is connected
     */
    SubscriptionId subscribe(const std::string& pattern,
                             std::shared_ptr<ports::IMessageHandler> handler,
                             QoS qos = QoS::AtLeastOnce);

    bool unsubscribe(SubscriptionId id);

    /// Session reached Connected: re-issue every pattern
    void onConnected();
    void onDisconnected();

    /// Forget all subscriptions and queued messages
    void clear();

    /// Inbound path from the transport; queues only
    void onMessage(std::string_view topic, std::string_view payload);

    /// Run queued messages through the handlers; re-entrant calls return at once
    void dispatchPending();

    void setErrorSink(ErrorSink sink) { errorSink_ = std::move(sink); }

    std::size_t subscriptionCount() const { return entries_.size(); }
    std::size_t patternCount() const { return patterns_.size(); }
    std::size_t queuedCount() const;

private:
    struct Entry {
        SubscriptionId id;
        std::string pattern;
        std::shared_ptr<ports::IMessageHandler> handler;
        QoS qos;
        bool active = true;
    };

    struct PatternState {
        int references = 0;
        QoS qos = QoS::AtMostOnce;
        QoS issuedQos = QoS::AtMostOnce;
        bool issued = false;
        std::uint64_t issueSeq = 0;     // matches SUBACKs to the latest request
    };

    void issue(const std::string& pattern, PatternState& state);
    void onSubscribeResult(const std::string& pattern, std::uint64_t seq, bool granted,
                           const std::string& reason);
    void dispatch(const Message& message);
    void report(ErrorCode code, const std::string& message, const std::string& topic);

    std::shared_ptr<ports::ITransport> transport_;
    ErrorSink errorSink_;

    std::map<SubscriptionId, std::shared_ptr<Entry>> entries_;   // ordered by registration
    std::map<std::string, PatternState> patterns_;
    SubscriptionId nextId_ = 1;
    bool connected_ = false;

    std::unordered_map<std::string, std::deque<Message>> queues_;
    std::deque<std::string> readyTopics_;
    bool dispatching_ = false;
};

} // namespace iotagent::domain
