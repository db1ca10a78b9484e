#include "TickScheduler.hpp"

#include <algorithm>
#include <utility>

namespace push_to_talk {

TickScheduler::TickScheduler(const IClock& clock)
    : _clock(clock)
    , _next_id(1) {
}

TimerId TickScheduler::ScheduleAfter(Seconds delay, Task task) {
    if (!task) {
        return kInvalidTimer;
    }
    if (delay < Seconds::zero()) {
        delay = Seconds::zero();
    }

    const TimerId id = _next_id++;
    _entries.push_back({id, _clock.Now() + ToClockDuration(delay), std::move(task)});
    return id;
}

bool TickScheduler::Cancel(TimerId id) {
    auto it = std::find_if(_entries.begin(), _entries.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == _entries.end()) {
        return false;
    }
    _entries.erase(it);
    return true;
}

bool TickScheduler::IsPending(TimerId id) const {
    return std::any_of(_entries.begin(), _entries.end(),
                       [id](const Entry& e) { return e.id == id; });
}

size_t TickScheduler::RunDue() {
    const TimePoint now = _clock.Now();
    const TimerId lastId = _next_id - 1;
    size_t ran = 0;

    while (true) {
        auto next = _entries.end();
        for (auto it = _entries.begin(); it != _entries.end(); ++it) {
            if (it->id > lastId || it->deadline > now) continue;
            if (next == _entries.end() ||
                it->deadline < next->deadline ||
                (it->deadline == next->deadline && it->id < next->id)) {
                next = it;
            }
        }
        if (next == _entries.end()) {
            break;
        }

        // Removed before running so the task may cancel or reschedule freely
        Task task = std::move(next->task);
        _entries.erase(next);
        task();
        ++ran;
    }

    return ran;
}

} // namespace push_to_talk
