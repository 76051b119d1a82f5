#include "SimulatedClock.hpp"

namespace iotagent::sim {

SimulatedClock::SimulatedClock(std::chrono::steady_clock::time_point startTime)
    : simulatedTime_(startTime),
      realStartTime_(std::chrono::steady_clock::now()),
      steadyEpoch_(startTime),
      wallEpoch_(std::chrono::system_clock::now()) {
}

std::chrono::steady_clock::time_point SimulatedClock::now() const {
    if (frozen_) {
        return simulatedTime_;
    }

    // Return simulated time + elapsed real time since the last adjustment
    auto realElapsed = std::chrono::steady_clock::now() - realStartTime_;
    return simulatedTime_ + realElapsed;
}

std::chrono::system_clock::time_point SimulatedClock::wallTime() const {
    return wallEpoch_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(now() - steadyEpoch_);
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    simulatedTime_ = now() + duration;
    realStartTime_ = std::chrono::steady_clock::now(); // Reset real time reference
}

void SimulatedClock::setCurrentTime(std::chrono::steady_clock::time_point time) {
    simulatedTime_ = time;
    realStartTime_ = std::chrono::steady_clock::now(); // Reset real time reference
}

void SimulatedClock::freezeTime() {
    simulatedTime_ = now();
    frozen_ = true;
}

void SimulatedClock::unfreezeTime() {
    realStartTime_ = std::chrono::steady_clock::now();
    frozen_ = false;
}

} // namespace iotagent::sim
