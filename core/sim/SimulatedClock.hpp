#pragma once

#include "../IClock.hpp"
#include <chrono>

namespace iotagent::sim {

class SimulatedClock : public IClock {
public:
    SimulatedClock(std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now());
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::steady_clock::time_point now() const override;
    std::chrono::system_clock::time_point wallTime() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(std::chrono::steady_clock::time_point time);

    // Time manipulation for testing
    void freezeTime();
    void unfreezeTime();
    bool isFrozen() const { return frozen_; }

private:
    std::chrono::steady_clock::time_point simulatedTime_;
    std::chrono::steady_clock::time_point realStartTime_;
    std::chrono::steady_clock::time_point steadyEpoch_;
    std::chrono::system_clock::time_point wallEpoch_;
    bool frozen_ = false;
};

} // namespace iotagent::sim
