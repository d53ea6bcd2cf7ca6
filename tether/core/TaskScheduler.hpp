#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace Tether {

using Milliseconds = std::chrono::milliseconds;
using TaskId = uint64_t;
using Task = std::function<void()>;

/**
 * @brief Timer and serial execution context for a save session
 *
 * Tasks run one at a time in deadline order; tasks with equal deadlines run
 * in submission order. Cancelling a task that already ran is a no-op.
 */
class ITaskScheduler {
public:
    virtual ~ITaskScheduler() = default;

    /**
     * @brief Run a task after the given delay
     * @return Id usable with Cancel()
     */
    virtual TaskId ScheduleAfter(Milliseconds delay, Task task) = 0;

    /**
     * @brief Cancel a scheduled task
     * @return True if the task was still pending
     */
    virtual bool Cancel(TaskId id) = 0;

    /**
     * @brief Milliseconds elapsed on the scheduler's clock
     */
    [[nodiscard]] virtual Milliseconds Now() const = 0;

    TaskId Post(Task task) { return ScheduleAfter(Milliseconds(0), std::move(task)); }
};

/**
 * @brief Configuration for the threaded scheduler
 */
struct TaskSchedulerConfig {
    std::string threadName = "Tether_Scheduler";
};

/**
 * @brief ITaskScheduler backed by a single worker thread
 *
 * The worker waits on a condition variable until the earliest deadline is due
 * or a new task is submitted. Exceptions escaping a task are logged and
 * discarded so the worker keeps running.
 */
class ThreadTaskScheduler : public ITaskScheduler {
public:
    explicit ThreadTaskScheduler(TaskSchedulerConfig config = {});
    ~ThreadTaskScheduler() override;

    ThreadTaskScheduler(const ThreadTaskScheduler&) = delete;
    ThreadTaskScheduler& operator=(const ThreadTaskScheduler&) = delete;

    TaskId ScheduleAfter(Milliseconds delay, Task task) override;
    bool Cancel(TaskId id) override;
    [[nodiscard]] Milliseconds Now() const override;

    /**
     * @brief Stop the worker; pending tasks are dropped
     */
    void Shutdown();

    [[nodiscard]] bool IsRunning() const { return m_running; }

    /**
     * @brief Number of tasks waiting to run
     */
    [[nodiscard]] size_t GetPendingCount() const;

private:
    using Clock = std::chrono::steady_clock;

    struct ScheduledTask {
        Clock::time_point deadline;
        uint64_t sequence = 0;
        TaskId id = 0;
        Task task;
    };

    struct LaterFirst {
        bool operator()(const ScheduledTask& a, const ScheduledTask& b) const {
            if (a.deadline != b.deadline) {
                return a.deadline > b.deadline;
            }
            return a.sequence > b.sequence;
        }
    };

    void WorkerLoop();

    TaskSchedulerConfig m_config;
    Clock::time_point m_start;

    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>, LaterFirst> m_tasks;
    std::unordered_set<TaskId> m_pending;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;

    std::thread m_worker;
    std::atomic<bool> m_running{false};
    TaskId m_nextId = 1;
    uint64_t m_nextSequence = 0;
};

} // namespace Tether
