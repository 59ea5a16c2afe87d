// SPDX-License-Identifier: MIT
#include "src/client/scheduler.hpp"

#include <algorithm>
#include <thread>

namespace sash {

// ============================================================================
// TimerQueue
// ============================================================================

TimerId TimerQueue::add(Clock::time_point due, Task task) {
    const TimerId id = next_id_++;
    tasks_.emplace(Key{due, id}, std::move(task));
    due_by_id_.emplace(id, due);
    return id;
}

bool TimerQueue::remove(TimerId id) {
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end()) {
        return false;
    }
    // Move the task out so its destructor runs after the queue is consistent
    auto node = tasks_.extract(Key{it->second, id});
    due_by_id_.erase(it);
    return !node.empty();
}

std::optional<TimerQueue::Clock::time_point> TimerQueue::next_due() const {
    if (tasks_.empty()) return std::nullopt;
    return tasks_.begin()->first.due;
}

std::optional<TimerQueue::Task> TimerQueue::pop_due(Clock::time_point now) {
    if (tasks_.empty() || tasks_.begin()->first.due > now) {
        return std::nullopt;
    }
    auto node = tasks_.extract(tasks_.begin());
    due_by_id_.erase(node.key().id);
    return std::move(node.mapped());
}

// ============================================================================
// EventLoop
// ============================================================================

TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, Task task) {
    return queue_.add(Clock::now() + std::max(delay, std::chrono::milliseconds{0}),
                      std::move(task));
}

bool EventLoop::cancel(TimerId id) {
    return queue_.remove(id);
}

size_t EventLoop::poll() {
    size_t ran = 0;
    while (auto task = queue_.pop_due(Clock::now())) {
        (*task)();
        ++ran;
    }
    return ran;
}

size_t EventLoop::run_for(std::chrono::milliseconds duration) {
    const auto deadline = Clock::now() + duration;
    size_t ran = 0;
    while (true) {
        ran += poll();
        auto next = queue_.next_due();
        const auto now = Clock::now();
        if (now >= deadline) break;
        std::this_thread::sleep_until(next ? std::min(*next, deadline) : deadline);
    }
    return ran;
}

size_t EventLoop::run_until_idle() {
    size_t ran = 0;
    while (auto next = queue_.next_due()) {
        std::this_thread::sleep_until(*next);
        ran += poll();
    }
    return ran;
}

// ============================================================================
// ManualScheduler
// ============================================================================

TimerId ManualScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    return queue_.add(now_ + std::max(delay, std::chrono::milliseconds{0}), std::move(task));
}

bool ManualScheduler::cancel(TimerId id) {
    return queue_.remove(id);
}

size_t ManualScheduler::advance(std::chrono::milliseconds duration) {
    const auto target = now_ + duration;
    size_t ran = 0;
    while (auto next = queue_.next_due()) {
        if (*next > target) break;
        now_ = std::max(now_, *next);
        ran += run_ready();
    }
    now_ = target;
    return ran;
}

size_t ManualScheduler::run_ready() {
    size_t ran = 0;
    while (auto task = queue_.pop_due(now_)) {
        (*task)();
        ++ran;
    }
    return ran;
}

}  // namespace sash
