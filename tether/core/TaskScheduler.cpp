#include "core/TaskScheduler.hpp"
#include "core/Logger.hpp"

#include <exception>

#ifdef __linux__
#include <pthread.h>
#endif

namespace Tether {

ThreadTaskScheduler::ThreadTaskScheduler(TaskSchedulerConfig config)
    : m_config(std::move(config))
    , m_start(Clock::now()) {
    m_running = true;
    m_worker = std::thread(&ThreadTaskScheduler::WorkerLoop, this);
}

ThreadTaskScheduler::~ThreadTaskScheduler() {
    Shutdown();
}

TaskId ThreadTaskScheduler::ScheduleAfter(Milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = Milliseconds(0);
    }

    TaskId id = 0;
    {
        std::lock_guard lock(m_mutex);
        if (!m_running) {
            TETHER_LOG_WARN("Task submitted to stopped scheduler, ignoring");
            return 0;
        }

        id = m_nextId++;
        m_tasks.push(ScheduledTask{Clock::now() + delay, m_nextSequence++, id, std::move(task)});
        m_pending.insert(id);
    }
    m_condition.notify_one();
    return id;
}

bool ThreadTaskScheduler::Cancel(TaskId id) {
    std::lock_guard lock(m_mutex);
    // The heap entry is skipped by the worker once its id is gone
    return m_pending.erase(id) > 0;
}

Milliseconds ThreadTaskScheduler::Now() const {
    return std::chrono::duration_cast<Milliseconds>(Clock::now() - m_start);
}

size_t ThreadTaskScheduler::GetPendingCount() const {
    std::lock_guard lock(m_mutex);
    return m_pending.size();
}

void ThreadTaskScheduler::Shutdown() {
    {
        std::lock_guard lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
    }
    m_condition.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }

    std::lock_guard lock(m_mutex);
    while (!m_tasks.empty()) {
        m_tasks.pop();
    }
    m_pending.clear();
    TETHER_LOG_DEBUG("Task scheduler '{}' stopped", m_config.threadName);
}

void ThreadTaskScheduler::WorkerLoop() {
#ifdef __linux__
    pthread_setname_np(pthread_self(), m_config.threadName.substr(0, 15).c_str());
#endif

    while (true) {
        ScheduledTask next;

        {
            std::unique_lock lock(m_mutex);

            while (m_running) {
                if (m_tasks.empty()) {
                    m_condition.wait(lock);
                    continue;
                }

                const auto& top = m_tasks.top();
                if (!m_pending.contains(top.id)) {
                    m_tasks.pop();
                    continue;
                }

                const Clock::time_point deadline = top.deadline;
                if (deadline <= Clock::now()) {
                    break;
                }

                m_condition.wait_until(lock, deadline);
            }

            if (!m_running) {
                return;
            }

            next = m_tasks.top();
            m_tasks.pop();
            m_pending.erase(next.id);
        }

        try {
            next.task();
        } catch (const std::exception& e) {
            TETHER_LOG_ERROR("Scheduled task {} threw: {}", next.id, e.what());
        }
    }
}

} // namespace Tether
