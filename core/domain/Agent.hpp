/**
 * @file Agent.hpp
 * @brief Public surface of the agent session runtime
 *
 * The Agent owns one session on one transport and runs cooperatively: the
 * application calls processEvents() in its loop. One tick runs, in order,
 *   1. transport events (connection results, acks, inbound messages)
 *   2. connection timers (connect timeout, backoff, keepalive)
 *   3. inbound dispatch to subscription handlers
 *   4. call deadlines
 *   5. outbound drain, ack timeouts and retries
 *
 * Example:
 * @code
 *   Agent agent(config, transport);
 *   agent.subscribe("sensors/+", [](const Message& m) { ... });
 *   agent.connect();
 *   while (running) { agent.processEvents(); sleep(10ms); }
 *   agent.disconnect();
 * @endcode
 */

#pragma once

#include "CommandCorrelator.hpp"
#include "ConnectionManager.hpp"
#include "Session.hpp"
#include "SubscriptionRouter.hpp"
#include "TelemetryPublisher.hpp"
#include "../AgentConfig.hpp"
#include "../Errors.hpp"
#include "../IClock.hpp"
#include "../IRng.hpp"
#include "../IdGenerator.hpp"
#include "../Message.hpp"
#include "../ports/IMessageHandler.hpp"
#include "../ports/ITransport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace iotagent::domain {

class Agent {
public:
    using StateListener = ConnectionManager::StateListener;
    using DeliveryListener = TelemetryPublisher::DeliveryListener;
    using CallCallback = CommandCorrelator::CallCallback;

    /**
     * @brief Build the runtime around a transport
     * @param config Agent configuration; a client id is generated when empty
     * @param transport Wire-level transport (Paho adapter or MockTransport)
     * @param clock Time source for every timer (SystemClock when null)
     * @param rng Jitter source for reconnect backoff (StandardRng when null)
     * @param idGenerator Correlation and client ids (UuidGenerator when null)
     * @throws std::invalid_argument if the configuration is invalid
     */
    Agent(AgentConfig config,
          std::shared_ptr<ports::ITransport> transport,
          std::shared_ptr<IClock> clock = nullptr,
          std::shared_ptr<IRng> rng = nullptr,
          std::shared_ptr<IIdGenerator> idGenerator = nullptr);

    /// Closes the session if still open
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    /**
     * @brief Start connecting; progress is made by processEvents()
     * @return false if already started or closed
     */
    bool connect();

    /**
     * @brief Close the session for good
     *
     * Pending jobs are handed to the transport while still connected, the
     * rest are reported as failed; pending calls complete with Cancelled;
     * subscriptions are dropped; the transport is closed.
     */
    void disconnect();

    /**
     * @throws std::invalid_argument for an invalid filter or a null handler
     * @throws std::logic_error after disconnect()
     */
    SubscriptionId subscribe(const std::string& pattern,
                             std::shared_ptr<ports::IMessageHandler> handler,
                             QoS qos = QoS::AtLeastOnce);
    SubscriptionId subscribe(const std::string& pattern,
                             std::function<void(const Message&)> handler,
                             QoS qos = QoS::AtLeastOnce);
    bool unsubscribe(SubscriptionId id);

    /// Queue with the configured default level
    PublishResult publish(const std::string& topic, const std::string& payload);
    PublishResult publish(const std::string& topic, const std::string& payload, QoS qos);

    std::string call(const std::string& topic, const std::string& payload, CallCallback callback,
                     std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    bool cancel(const std::string& callId);

    /// One scheduler tick; nested calls from handlers return immediately
    void processEvents();

    SessionState state() const { return connection_->state(); }
    const Session& session() const { return connection_->session(); }
    const AgentConfig& config() const { return config_; }

    std::size_t pendingCalls() const { return correlator_->pendingCount(); }
    std::size_t queuedJobs() const { return publisher_->size(); }
    std::size_t inflightJobs() const { return publisher_->inflightCount(); }

    /// Replace the default sink (one line on std::cerr per error)
    void setErrorSink(ErrorSink sink) { errorSink_ = std::move(sink); }
    void setStateListener(StateListener listener) { stateListener_ = std::move(listener); }
    void setDeliveryListener(DeliveryListener listener) { deliveryListener_ = std::move(listener); }

private:
    void onStateChange(SessionState from, SessionState to, const std::string& reason);
    void report(const AgentError& error);

    AgentConfig config_;
    std::shared_ptr<ports::ITransport> transport_;
    std::shared_ptr<IClock> clock_;

    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<SubscriptionRouter> router_;
    std::shared_ptr<CommandCorrelator> correlator_;
    std::shared_ptr<TelemetryPublisher> publisher_;

    ErrorSink errorSink_ = logError;
    StateListener stateListener_;
    DeliveryListener deliveryListener_;

    bool ticking_ = false;
};

} // namespace iotagent::domain
