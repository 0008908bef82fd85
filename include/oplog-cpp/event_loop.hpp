/// @file event_loop.hpp
/// @brief A manually driven, single-threaded event loop.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <utility>

namespace oplog_cpp {

/// Cooperative event loop with microtasks and virtual-time timers.
///
/// Nothing runs on its own: the host calls run_microtasks() after each
/// synchronous burst of work and advance() as time passes (a frame tick,
/// a network poll). Tests drive it the same way, which makes guard
/// release and retry backoff fully deterministic.
///
/// @code
/// auto loop = EventLoop{};
/// loop.post([] { std::puts("after the current task"); });
/// loop.post_after(100, [] { std::puts("100 ms later"); });
/// loop.run_microtasks();
/// loop.advance(100);
/// @endcode
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    /// Construct with the virtual clock at `start_ms`.
    explicit EventLoop(std::int64_t start_ms = 0) : now_ms_{start_ms} {}

    EventLoop(const EventLoop&) = delete;
    auto operator=(const EventLoop&) -> EventLoop& = delete;

    /// Queue a microtask: it runs at the next run_microtasks().
    void post(Task task);

    /// Run `task` once the clock has advanced by `delay_ms`.
    auto post_after(std::int64_t delay_ms, Task task) -> TimerId;

    /// Cancel a timer. Returns false if it already ran or never existed.
    auto cancel(TimerId id) -> bool;

    /// Run queued microtasks, including ones they post, until none remain.
    /// @return The number of microtasks run.
    auto run_microtasks() -> std::size_t;

    /// Advance the clock by `ms`, running every timer that falls due in
    /// deadline order and draining microtasks after each one.
    /// @return The number of timers run.
    auto advance(std::int64_t ms) -> std::size_t;

    /// Current virtual time in milliseconds.
    auto now_ms() const -> std::int64_t { return now_ms_; }

    auto pending_microtasks() const -> std::size_t { return microtasks_.size(); }
    auto pending_timers() const -> std::size_t { return timers_.size(); }

private:
    // (deadline, id) keeps timers with equal deadlines in posting order.
    using TimerKey = std::pair<std::int64_t, TimerId>;

    std::int64_t now_ms_;
    TimerId next_timer_id_{1};
    std::deque<Task> microtasks_;
    std::map<TimerKey, Task> timers_;
};

}  // namespace oplog_cpp
