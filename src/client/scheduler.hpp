// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>

namespace sash {

using TimerId = std::uint64_t;

/// Single logical thread of cooperative work: deferred tasks and timers
///
/// All client-side orchestration (debounce timers, transport completions)
/// runs as tasks on one Scheduler. Implementations are not thread-safe; they
/// must be driven and fed from one thread.
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /// Run `task` once, no earlier than `delay` from now.
    /// Tasks with equal deadlines run in scheduling order.
    virtual TimerId schedule_after(std::chrono::milliseconds delay, Task task) = 0;

    /// Drop a task that has not run yet.
    /// @return false when the task already ran or was cancelled
    virtual bool cancel(TimerId id) = 0;

    [[nodiscard]] virtual Clock::time_point now() const = 0;

    TimerId post(Task task) {
        return schedule_after(std::chrono::milliseconds{0}, std::move(task));
    }
};

/// Deadline-ordered task storage shared by the Scheduler implementations
class TimerQueue {
public:
    using Clock = Scheduler::Clock;
    using Task = Scheduler::Task;

    TimerId add(Clock::time_point due, Task task);
    bool remove(TimerId id);

    [[nodiscard]] std::optional<Clock::time_point> next_due() const;

    /// Remove and return the earliest task due at or before `now`
    [[nodiscard]] std::optional<Task> pop_due(Clock::time_point now);

    [[nodiscard]] size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }

private:
    struct Key {
        Clock::time_point due;
        TimerId id;
        bool operator<(const Key& other) const noexcept {
            return due != other.due ? due < other.due : id < other.id;
        }
    };

    std::map<Key, Task> tasks_;
    std::unordered_map<TimerId, Clock::time_point> due_by_id_;
    TimerId next_id_ = 1;
};

/// Scheduler driven by the steady clock
///
/// Nothing runs until the owner pumps the loop with poll(), run_for() or
/// run_until_idle().
class EventLoop final : public Scheduler {
public:
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;
    [[nodiscard]] Clock::time_point now() const override { return Clock::now(); }

    /// Run every task that is already due. @return tasks run
    size_t poll();

    /// Run tasks as they fall due for `duration`, sleeping in between
    size_t run_for(std::chrono::milliseconds duration);

    /// Run until no task is left
    size_t run_until_idle();

    [[nodiscard]] size_t pending() const noexcept { return queue_.size(); }

private:
    TimerQueue queue_;
};

/// Scheduler on a virtual clock that only moves when told to
///
/// Makes debounce windows and transport latency deterministic in tests and
/// in hosts that bring their own frame clock.
class ManualScheduler final : public Scheduler {
public:
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TimerId id) override;
    [[nodiscard]] Clock::time_point now() const override { return now_; }

    /// Move the clock forward, running every task that falls due on the way
    /// (at its own deadline). @return tasks run
    size_t advance(std::chrono::milliseconds duration);

    /// Run tasks due at the current instant, including ones they post
    size_t run_ready();

    [[nodiscard]] size_t pending() const noexcept { return queue_.size(); }

private:
    TimerQueue queue_;
    Clock::time_point now_{};
};

}  // namespace sash
