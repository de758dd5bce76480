#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace clawlink {

using TaskId = uint64_t;
using Task = std::function<void()>;

// Timer service for backoff and heartbeat work. Injectable so that the
// connection state machine can be driven by a manual clock in tests.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Run `task` once after `delay`. Returns an ID usable with cancel().
    virtual TaskId schedule_after(std::chrono::milliseconds delay, Task task) = 0;

    // Returns true if the task had not started yet and will not run.
    virtual bool cancel(TaskId id) = 0;
};

// One worker thread driven by std::chrono::steady_clock.
// Tasks run on the worker, one at a time, in due-time order.
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId schedule_after(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TaskId id) override;

    // Drop pending tasks and join the worker. Idempotent.
    void stop();

    size_t pending() const;

private:
    using Clock = std::chrono::steady_clock;

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<Clock::time_point, TaskId> due_;
    std::unordered_map<TaskId, Task> tasks_;
    TaskId next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace clawlink
