#include "Agent.hpp"
#include "../adapters/DefaultPolicies.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace iotagent::domain {

namespace {

AgentConfig resolved(AgentConfig config, IIdGenerator& ids) {
    config.resolve(ids);

    auto problems = config.validate();
    if (!problems.empty()) {
        std::ostringstream oss;
        oss << "Invalid agent configuration:";
        for (const auto& problem : problems) {
            oss << " " << problem << ";";
        }
        throw std::invalid_argument(oss.str());
    }
    return config;
}

} // namespace

Agent::Agent(AgentConfig config,
             std::shared_ptr<ports::ITransport> transport,
             std::shared_ptr<IClock> clock,
             std::shared_ptr<IRng> rng,
             std::shared_ptr<IIdGenerator> idGenerator)
    : transport_(std::move(transport)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {

    if (!transport_) {
        throw std::invalid_argument("Agent requires a transport");
    }
    if (!rng) {
        rng = std::make_shared<StandardRng>();
    }
    if (!idGenerator) {
        idGenerator = std::make_shared<UuidGenerator>();
    }

    config_ = resolved(std::move(config), *idGenerator);

    auto policyEngine = std::make_shared<adapters::DefaultPolicyEngine>(config_, rng);

    connection_ = std::make_shared<ConnectionManager>(transport_, clock_, policyEngine, config_);
    router_ = std::make_shared<SubscriptionRouter>(transport_);
    correlator_ = std::make_shared<CommandCorrelator>(transport_, clock_, idGenerator,
                                                      config_.rpc.defaultTimeout,
                                                      config_.expand(config_.rpc.responseTopic));
    publisher_ = std::make_shared<TelemetryPublisher>(transport_, clock_, policyEngine,
                                                      config_.publisher.queueCapacity,
                                                      config_.publisher.maxInflight);

    auto sink = [this](const AgentError& error) { report(error); };
    connection_->setErrorSink(sink);
    router_->setErrorSink(sink);
    correlator_->setErrorSink(sink);
    publisher_->setErrorSink(sink);

    publisher_->setDeliveryListener([this](const DeliveryReport& report) {
        if (deliveryListener_) {
            deliveryListener_(report);
        }
    });

    connection_->addStateListener([this](SessionState from, SessionState to, const std::string& reason) {
        onStateChange(from, to, reason);
    });

    std::weak_ptr<SubscriptionRouter> weakRouter = router_;
    transport_->setMessageHandler([weakRouter](std::string_view topic, std::string_view payload) {
        if (auto router = weakRouter.lock()) {
            router->onMessage(topic, payload);
        }
    });

    std::weak_ptr<CommandCorrelator> weakCorrelator = correlator_;
    router_->subscribe(correlator_->responseFilter(),
        ports::makeHandler([weakCorrelator](const Message& message) {
            if (auto correlator = weakCorrelator.lock()) {
                correlator->onResponse(message);
            }
        }),
        QoS::AtLeastOnce);

    std::cout << "[Agent] Created for client " << config_.broker.clientId
              << " (" << config_.broker.uri << ")" << std::endl;
}

Agent::~Agent() {
    disconnect();
    transport_->setMessageHandler(nullptr);
    transport_->setConnectionHandler(nullptr);
}

bool Agent::connect() {
    return connection_->start();
}

void Agent::disconnect() {
    if (connection_->session().isClosed()) {
        return;
    }
    std::cout << "[Agent] Disconnecting" << std::endl;

    publisher_->drainForShutdown();
    correlator_->close();
    correlator_->failAll(ErrorCode::Cancelled, "agent closed");
    router_->clear();
    connection_->shutdown();
}

SubscriptionId Agent::subscribe(const std::string& pattern,
                                std::shared_ptr<ports::IMessageHandler> handler,
                                QoS qos) {
    if (connection_->session().isClosed()) {
        throw std::logic_error("Agent is closed");
    }
    return router_->subscribe(pattern, std::move(handler), qos);
}

SubscriptionId Agent::subscribe(const std::string& pattern,
                                std::function<void(const Message&)> handler,
                                QoS qos) {
    return subscribe(pattern, ports::makeHandler(std::move(handler)), qos);
}

bool Agent::unsubscribe(SubscriptionId id) {
    return router_->unsubscribe(id);
}

PublishResult Agent::publish(const std::string& topic, const std::string& payload) {
    return publish(topic, payload, config_.publisher.defaultQos);
}

PublishResult Agent::publish(const std::string& topic, const std::string& payload, QoS qos) {
    auto result = publisher_->publish(topic, payload, qos);
    if (result.status == ErrorCode::Backpressure) {
        report(AgentError{ErrorCode::Backpressure, "outbound queue full", topic});
    }
    return result;
}

std::string Agent::call(const std::string& topic, const std::string& payload, CallCallback callback,
                        std::optional<std::chrono::milliseconds> timeout) {
    return correlator_->call(topic, payload, std::move(callback), timeout);
}

bool Agent::cancel(const std::string& callId) {
    return correlator_->cancel(callId);
}

void Agent::processEvents() {
    if (ticking_ || connection_->session().isClosed()) {
        return;
    }

    // Listener exceptions propagate to the caller; the flag must not stick
    struct TickGuard {
        bool& flag;
        explicit TickGuard(bool& f) : flag(f) { flag = true; }
        ~TickGuard() { flag = false; }
    } guard(ticking_);

    connection_->pumpTransport();
    connection_->checkTimers();
    router_->dispatchPending();
    correlator_->checkTimeouts();
    publisher_->processEvents();
}

void Agent::onStateChange(SessionState from, SessionState to, const std::string& reason) {
    if (to == SessionState::Connected) {
        router_->onConnected();
        correlator_->setSessionActive(true);
        publisher_->onSessionEstablished();
    } else if (from == SessionState::Connected) {
        router_->onDisconnected();
        correlator_->setSessionActive(false);
        correlator_->failAll(ErrorCode::SessionLost, reason);
        publisher_->onSessionLost();
    }

    if (stateListener_) {
        stateListener_(from, to, reason);
    }
}

void Agent::report(const AgentError& error) {
    if (errorSink_) {
        errorSink_(error);
    }
}

} // namespace iotagent::domain
