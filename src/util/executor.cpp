#include <locus/executor.hpp>
#include <locus/log.hpp>
#include <exception>

namespace locus {

static void run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        log::error("task failed: %s", e.what());
    }
}

void InlineExecutor::post(Task task) {
    run_task(task);
}

SerialQueue::SerialQueue() {
    worker_ = std::thread([this]() { worker_loop(); });
}

SerialQueue::~SerialQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SerialQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void SerialQueue::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !tasks_.empty() || stopping_; });
            // Queue is drained before stopping
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        run_task(task);
    }
}

void ManualExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
}

size_t ManualExecutor::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }
    for (const auto& task : batch) {
        run_task(task);
    }
    return batch.size();
}

size_t ManualExecutor::wait_and_run(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !tasks_.empty(); });
    }
    return run_pending();
}

} // namespace locus
