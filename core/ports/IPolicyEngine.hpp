#pragma once

#include <chrono>

namespace iotagent::ports {

struct ReconnectPolicy {
    virtual ~ReconnectPolicy() = default;
    // attempt is 0 for the first retry after a failure
    virtual std::chrono::milliseconds getBackoffDelay(int attempt) const = 0;
};

struct DeliveryPolicy {
    virtual ~DeliveryPolicy() = default;
    // attemptCount counts failed attempts so far
    virtual bool shouldRetry(int attemptCount) const = 0;
    virtual std::chrono::milliseconds getRetryDelay(int attemptCount) const = 0;
    virtual std::chrono::milliseconds getAckTimeout() const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;

    virtual const ReconnectPolicy& getReconnectPolicy() const = 0;
    virtual const DeliveryPolicy& getDeliveryPolicy() const = 0;
};

} // namespace iotagent::ports
