#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../AgentConfig.hpp"
#include "../IRng.hpp"
#include <algorithm>
#include <cmath>
#include <memory>

namespace iotagent::adapters {

class ExponentialBackoffReconnectPolicy : public ports::ReconnectPolicy {
public:
    ExponentialBackoffReconnectPolicy(std::shared_ptr<IRng> rng,
                                      std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                      std::chrono::milliseconds maxDelay = std::chrono::minutes(1),
                                      int jitterPct = 20)
        : rng_(std::move(rng)), baseDelay_(baseDelay), maxDelay_(maxDelay), jitterPct_(jitterPct) {}

    std::chrono::milliseconds getBackoffDelay(int attempt) const override {
        double exponential = static_cast<double>(baseDelay_.count()) * std::pow(2.0, std::max(attempt, 0));
        auto capped = static_cast<long long>(std::min(exponential, static_cast<double>(maxDelay_.count())));

        long long jitter = 0;
        if (rng_ && jitterPct_ > 0) {
            jitter = capped * rng_->uniformInt(-jitterPct_, jitterPct_) / 100;
        }
        return std::chrono::milliseconds(std::max(0LL, capped + jitter));
    }

private:
    std::shared_ptr<IRng> rng_;
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxDelay_;
    int jitterPct_;
};

class BoundedDeliveryPolicy : public ports::DeliveryPolicy {
public:
    BoundedDeliveryPolicy(int maxRetries = 5,
                          std::chrono::milliseconds retryDelay = std::chrono::milliseconds(1000),
                          std::chrono::milliseconds ackTimeout = std::chrono::seconds(10),
                          double multiplier = 2.0,
                          std::chrono::milliseconds maxDelay = std::chrono::minutes(1))
        : maxRetries_(maxRetries), retryDelay_(retryDelay), ackTimeout_(ackTimeout),
          multiplier_(multiplier), maxDelay_(maxDelay) {}

    bool shouldRetry(int attemptCount) const override {
        return attemptCount <= maxRetries_;
    }

    std::chrono::milliseconds getRetryDelay(int attemptCount) const override {
        // Clamp before converting: the raw product overflows long long after a few dozen attempts
        double delay = static_cast<double>(retryDelay_.count()) *
                       std::pow(multiplier_, std::max(attemptCount - 1, 0));
        return std::chrono::milliseconds(static_cast<long long>(
            std::min(delay, static_cast<double>(maxDelay_.count()))));
    }

    std::chrono::milliseconds getAckTimeout() const override {
        return ackTimeout_;
    }

private:
    int maxRetries_;
    std::chrono::milliseconds retryDelay_;
    std::chrono::milliseconds ackTimeout_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine(const AgentConfig& config, std::shared_ptr<IRng> rng)
        : reconnectPolicy_(std::move(rng), config.session.backoffBase, config.session.backoffCap,
                           config.session.backoffJitterPct),
          deliveryPolicy_(config.publisher.maxRetries, config.publisher.retryDelay,
                          config.publisher.ackTimeout, 2.0, config.session.backoffCap) {}

    const ports::ReconnectPolicy& getReconnectPolicy() const override {
        return reconnectPolicy_;
    }

    const ports::DeliveryPolicy& getDeliveryPolicy() const override {
        return deliveryPolicy_;
    }

private:
    ExponentialBackoffReconnectPolicy reconnectPolicy_;
    BoundedDeliveryPolicy deliveryPolicy_;
};

} // namespace iotagent::adapters
