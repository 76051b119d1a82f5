/**
 * @file CommandCorrelator.hpp
 * @brief Request/response over pub/sub topics matched by correlation id
 *
 * A request for topic T with id R is published to "T/?$rid=R". The responder
 * answers on any topic below the response root that carries "$rid=R", e.g.
 * "iot/rpc/<client>/res/200/?$rid=R". Each call completes exactly once.
 */

#pragma once

#include "../Errors.hpp"
#include "../IClock.hpp"
#include "../IdGenerator.hpp"
#include "../Message.hpp"
#include "../ports/ITransport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace iotagent::domain {

/**
 * @brief Outcome of a call
 *
 * status is ErrorCode::None for a response, otherwise one of Timeout,
 * Cancelled, SessionLost, DeliveryFailure or Closed.
 */
struct CallResult {
    std::string id;
    ErrorCode status = ErrorCode::None;
    std::string payload;              ///< Response payload when ok()
    std::string responseTopic;        ///< Topic the response arrived on
    std::string errorMessage;

    bool ok() const { return status == ErrorCode::None; }
};

class CommandCorrelator : public std::enable_shared_from_this<CommandCorrelator> {
public:
    using CallCallback = std::function<void(const CallResult&)>;

    CommandCorrelator(std::shared_ptr<ports::ITransport> transport,
                      std::shared_ptr<IClock> clock,
                      std::shared_ptr<IIdGenerator> idGenerator,
                      std::chrono::milliseconds defaultTimeout,
                      std::string responseTopic);

    /**
     * @brief Publish a request and wait for its correlated response
     * @param topic Request topic (no wildcards)
     * @param payload Request payload, sent unchanged
     * @param callback Receives the single completion
     * @param timeout Deadline from now; default timeout when unset
     * @return Correlation id, or an empty string when the call failed fast
     * @throws std::invalid_argument for an invalid topic or an empty callback
     * @note Fails fast with SessionLost when the session is not connected
     */
    std::string call(const std::string& topic, const std::string& payload, CallCallback callback,
                     std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @return false if no call with this id is pending
    bool cancel(const std::string& id);

    /// Response delivered by the router on responseFilter()
    void onResponse(const Message& message);

    /// Fail every call whose deadline has passed with Timeout
    void checkTimeouts();

    /// Fail every pending call with @p code (session lost, shutdown)
    void failAll(ErrorCode code, const std::string& reason);

    void setSessionActive(bool active) { active_ = active; }
    void close() { closed_ = true; }

    void setErrorSink(ErrorSink sink) { errorSink_ = std::move(sink); }

    std::size_t pendingCount() const { return pending_.size(); }
    bool isPending(const std::string& id) const { return pending_.count(id) > 0; }

    const std::string& responseTopic() const { return responseTopic_; }
    std::string responseFilter() const { return responseTopic_ + "/#"; }

private:
    struct PendingCall {
        std::string topic;
        std::chrono::steady_clock::time_point deadline;
        CallCallback callback;
    };

    std::string newId();
    void onRequestDelivery(const std::string& id, bool delivered, const std::string& reason);
    void complete(const std::string& id, ErrorCode status, const std::string& payload,
                  const std::string& detail);
    void invoke(const CallCallback& callback, const CallResult& result);

    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IIdGenerator> idGenerator_;
    std::chrono::milliseconds defaultTimeout_;
    std::string responseTopic_;

    std::unordered_map<std::string, PendingCall> pending_;
    bool active_ = false;
    bool closed_ = false;
    ErrorSink errorSink_;
};

} // namespace iotagent::domain
