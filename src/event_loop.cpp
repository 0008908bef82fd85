#include <oplog-cpp/event_loop.hpp>

#include <algorithm>
#include <utility>

namespace oplog_cpp {

void EventLoop::post(Task task) {
    microtasks_.push_back(std::move(task));
}

auto EventLoop::post_after(std::int64_t delay_ms, Task task) -> TimerId {
    auto id = next_timer_id_++;
    timers_.emplace(TimerKey{now_ms_ + std::max<std::int64_t>(delay_ms, 0), id}, std::move(task));
    return id;
}

auto EventLoop::cancel(TimerId id) -> bool {
    auto it = std::ranges::find_if(timers_, [id](const auto& kv) { return kv.first.second == id; });
    if (it == timers_.end()) return false;
    timers_.erase(it);
    return true;
}

auto EventLoop::run_microtasks() -> std::size_t {
    auto count = std::size_t{0};
    while (!microtasks_.empty()) {
        auto task = std::move(microtasks_.front());
        microtasks_.pop_front();
        task();
        ++count;
    }
    return count;
}

auto EventLoop::advance(std::int64_t ms) -> std::size_t {
    const auto target = now_ms_ + std::max<std::int64_t>(ms, 0);
    auto count = std::size_t{0};
    run_microtasks();
    while (!timers_.empty() && timers_.begin()->first.first <= target) {
        auto node = timers_.extract(timers_.begin());
        now_ms_ = std::max(now_ms_, node.key().first);
        node.mapped()();
        ++count;
        run_microtasks();
    }
    now_ms_ = target;
    return count;
}

}  // namespace oplog_cpp
