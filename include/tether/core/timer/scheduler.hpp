#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include "tether/core/timer/concepts.hpp"
#include "lcr/log/logger.hpp"


namespace tether::core::timer {

/*
===============================================================================
 tether::core::timer::Scheduler
===============================================================================

Poll-driven timer queue conforming to timer::TimerConcept.

No background thread: due callbacks run inside poll(), on the caller's
thread, ordered by due time and then by scheduling order.

-------------------------------------------------------------------------------
 Guarantees
-------------------------------------------------------------------------------
- An entry is removed before its callback runs, so cancel() from inside the
  callback (or of the firing id) is a harmless no-op
- A callback may schedule new timers; those never fire in the same poll(),
  even with a zero delay (no starvation of the caller's loop)
- Cancelled timers never fire

The Clock parameter only needs a static now() returning a
std::chrono::steady_clock::time_point, which lets tests drive time manually.
===============================================================================
*/

template <typename Clock = std::chrono::steady_clock>
class Scheduler {
public:
    using time_point = std::chrono::steady_clock::time_point;

    Scheduler() = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    [[nodiscard]]
    inline TimerId schedule(std::chrono::milliseconds delay, Callback cb) {
        if (delay < std::chrono::milliseconds::zero()) {
            delay = std::chrono::milliseconds::zero();
        }
        const TimerId id = next_id_++;
        const time_point due = now() + delay;
        queue_.emplace(Key{due, id}, std::move(cb));
        index_.emplace(id, due);
        return id;
    }

    inline bool cancel(TimerId id) noexcept {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return false;
        }
        queue_.erase(Key{it->second, id});
        index_.erase(it);
        return true;
    }

    [[nodiscard]]
    inline time_point now() const {
        return Clock::now();
    }

    // Fires every timer that is due and was scheduled before this call.
    // Returns the number of callbacks invoked.
    inline std::size_t poll() {
        const TimerId limit = next_id_;
        std::size_t fired = 0;
        for (;;) {
            const time_point current = now();
            auto it = queue_.begin();
            while (it != queue_.end() && it->first.id >= limit) {
                ++it;
            }
            if (it == queue_.end() || it->first.due > current) {
                break;
            }
            Callback cb = std::move(it->second);
            index_.erase(it->first.id);
            queue_.erase(it);
            ++fired;
            cb();
        }
        if (fired > 1) {
            TT_TRACE("[SCHED] Fired " << fired << " timers (" << queue_.size() << " pending)");
        }
        return fired;
    }

    [[nodiscard]]
    inline std::size_t pending() const noexcept {
        return queue_.size();
    }

    // Due time of the earliest pending timer (for callers that sleep between polls)
    [[nodiscard]]
    inline std::optional<time_point> next_due() const noexcept {
        if (queue_.empty()) {
            return std::nullopt;
        }
        return queue_.begin()->first.due;
    }

private:
    struct Key {
        time_point due;
        TimerId id;

        bool operator<(const Key& other) const noexcept {
            if (due != other.due) return due < other.due;
            return id < other.id;
        }
    };

    TimerId next_id_{1};
    std::map<Key, Callback> queue_;
    std::unordered_map<TimerId, time_point> index_;
};

static_assert(TimerConcept<Scheduler<>>);

} // namespace tether::core::timer
