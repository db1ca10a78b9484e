#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "../common/Clock.hpp"

namespace push_to_talk {

using TimerId = uint64_t;
constexpr TimerId kInvalidTimer = 0;

// Cooperative one-shot timers. Nothing runs on its own: the owner of the
// loop calls RunDue() once per tick, on the same thread as everything else.
class TickScheduler {
public:
    using Task = std::function<void()>;

    explicit TickScheduler(const IClock& clock);

    TimerId ScheduleAfter(Seconds delay, Task task);

    // False if the timer already ran, was cancelled or never existed
    bool Cancel(TimerId id);

    // Runs every task due at the current clock time in deadline order.
    // Tasks scheduled from inside a callback wait for the next call.
    size_t RunDue();

    size_t Pending() const { return _entries.size(); }
    bool IsPending(TimerId id) const;

private:
    struct Entry {
        TimerId id;
        TimePoint deadline;
        Task task;
    };

    const IClock& _clock;
    std::vector<Entry> _entries;
    TimerId _next_id;
};

} // namespace push_to_talk
