#include "scheduler.hpp"
#include <exception>
#include <iostream>

namespace clawlink {

ThreadScheduler::ThreadScheduler()
    : worker_([this] { run(); })
{}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

TaskId ThreadScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = next_id_++;
    if (stopping_) return id; // accepted but never run
    due_.emplace(Clock::now() + delay, id);
    tasks_.emplace(id, std::move(task));
    cv_.notify_one();
    return id;
}

bool ThreadScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.erase(id) == 0) return false;
    for (auto it = due_.begin(); it != due_.end(); ++it) {
        if (it->second == id) {
            due_.erase(it);
            break;
        }
    }
    return true;
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
        due_.clear();
        tasks_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

size_t ThreadScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (due_.empty()) {
            cv_.wait(lock);
            continue;
        }
        auto next = due_.begin();
        if (Clock::now() < next->first) {
            cv_.wait_until(lock, next->first);
            continue;
        }

        TaskId id = next->second;
        due_.erase(next);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) continue;
        Task task = std::move(it->second);
        tasks_.erase(it);

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] Task " << id << " threw: " << e.what() << "\n";
        }
        lock.lock();
    }
}

} // namespace clawlink
