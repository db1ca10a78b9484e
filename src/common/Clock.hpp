#pragma once

#include <chrono>

namespace push_to_talk {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::duration<double>;

class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint Now() const = 0;
};

class SteadyClock : public IClock {
public:
    TimePoint Now() const override { return Clock::now(); }
};

inline Clock::duration ToClockDuration(Seconds seconds) {
    return std::chrono::duration_cast<Clock::duration>(seconds);
}

} // namespace push_to_talk
