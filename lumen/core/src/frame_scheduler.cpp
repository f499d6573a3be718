/**
 * @file frame_scheduler.cpp
 * @brief TimerQueue implementation
 */

#include <lumen/core/frame_scheduler.hpp>
#include <lumen/core/logger.hpp>

#include <algorithm>
#include <exception>

namespace lumen {

TimerQueue::TimerQueue(TimeSource timeSource)
    : m_timeSource(timeSource ? std::move(timeSource) : steadyTimeSource())
{}

TaskId TimerQueue::schedule(Duration delay, Task task) {
    if (!task) {
        return kInvalidTask;
    }
    TaskId id = m_nextId++;
    int64_t due = m_timeSource() + std::max<Duration>(0, delay);
    m_tasks.emplace(due, Entry{id, std::move(task)});
    return id;
}

void TimerQueue::cancel(TaskId id) {
    if (id == kInvalidTask) {
        return;
    }
    for (auto it = m_tasks.begin(); it != m_tasks.end(); ++it) {
        if (it->second.id == id) {
            m_tasks.erase(it);
            return;
        }
    }
}

size_t TimerQueue::runDue() {
    const int64_t now = m_timeSource();

    // Snapshot due ids first; tasks scheduled while draining wait for the next call
    std::vector<TaskId> due;
    for (auto it = m_tasks.begin(); it != m_tasks.end() && it->first <= now; ++it) {
        due.push_back(it->second.id);
    }

    size_t ran = 0;
    for (TaskId id : due) {
        auto it = std::find_if(m_tasks.begin(), m_tasks.end(),
                               [id](const auto& kv) { return kv.second.id == id; });
        if (it == m_tasks.end()) {
            continue;   // cancelled by an earlier task
        }
        Task task = std::move(it->second.task);
        m_tasks.erase(it);

        try {
            task();
        } catch (const std::exception& e) {
            LUMEN_LOG_ERROR("Scheduled task {} threw: {}", id, e.what());
        }
        ++ran;
    }
    return ran;
}

Duration TimerQueue::timeUntilNext() const {
    if (m_tasks.empty()) {
        return kNoTimestamp;
    }
    return std::max<Duration>(0, m_tasks.begin()->first - m_timeSource());
}

} // namespace lumen
