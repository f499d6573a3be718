/**
 * @file frame_scheduler.hpp
 * @brief Cooperative delayed-task scheduling driven by the host loop
 *
 * The preview runs single-threaded: the host (SDL event loop, a test) owns
 * the loop and drains due tasks once per iteration. Nothing here spawns a
 * thread; a task runs to completion before the next one starts.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "clock.hpp"
#include "types.hpp"

namespace lumen {

using TaskId = uint64_t;
constexpr TaskId kInvalidTask = 0;

/// Host frame-callback abstraction
class FrameScheduler {
public:
    using Task = std::function<void()>;

    virtual ~FrameScheduler() = default;

    /// Run task once after delay (0 = next drain)
    virtual TaskId schedule(Duration delay, Task task) = 0;

    /// Cancel a pending task; unknown or finished ids are ignored
    virtual void cancel(TaskId id) = 0;

    /// Scheduler time in microseconds
    [[nodiscard]] virtual int64_t now() const = 0;
};

/**
 * @brief Ordered timer queue
 *
 * Tasks due at the same time run in scheduling order. Tasks scheduled from
 * inside a running task with zero delay run on the next runDue(), never in
 * the current one, so a self-rescheduling loop cannot starve the host.
 */
class TimerQueue : public FrameScheduler {
public:
    explicit TimerQueue(TimeSource timeSource = steadyTimeSource());

    TaskId schedule(Duration delay, Task task) override;
    void cancel(TaskId id) override;
    [[nodiscard]] int64_t now() const override { return m_timeSource(); }

    /// Run every task due at now(); returns the number of tasks run
    size_t runDue();

    /// Time until the earliest pending task (kNoTimestamp if none)
    [[nodiscard]] Duration timeUntilNext() const;

    [[nodiscard]] size_t pendingCount() const { return m_tasks.size(); }

    void clear() { m_tasks.clear(); }

private:
    struct Entry {
        TaskId id;
        Task task;
    };

    TimeSource m_timeSource;
    // due time -> task; multimap keeps insertion order for equal keys
    std::multimap<int64_t, Entry> m_tasks;
    TaskId m_nextId = 1;
};

} // namespace lumen
