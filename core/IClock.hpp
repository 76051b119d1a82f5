#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace iotagent {

class IClock {
public:
    virtual ~IClock() = default;

    /// Monotonic time used for deadlines, backoff and keepalive timers
    virtual std::chrono::steady_clock::time_point now() const = 0;

    /// Wall-clock time used for timestamps that go on the wire
    virtual std::chrono::system_clock::time_point wallTime() const = 0;

    uint64_t epochMicros() const {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            wallTime().time_since_epoch()).count());
    }

    std::string iso8601() const;
};

class SystemClock : public IClock {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    std::chrono::system_clock::time_point wallTime() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace iotagent
