#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace locus {

using Task = std::function<void()>;

// Something that runs tasks somewhere: a worker thread, the current thread,
// or an event loop owned by the caller.
class Executor {
public:
    virtual ~Executor() = default;
    virtual void post(Task task) = 0;
};

// Runs each task immediately on the posting thread.
class InlineExecutor : public Executor {
public:
    void post(Task task) override;
};

// A single worker thread running tasks one at a time in FIFO order.
// Destruction runs what is still queued, then joins the worker.
class SerialQueue : public Executor {
public:
    SerialQueue();
    ~SerialQueue() override;

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    void post(Task task) override;

private:
    void worker_loop();

    std::deque<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread worker_;
};

// Collects tasks until the owning thread pumps them with run_pending().
// Stands in for a UI main loop.
class ManualExecutor : public Executor {
public:
    void post(Task task) override;

    // Run everything queued so far on the calling thread. Returns the
    // number of tasks run.
    size_t run_pending();

    // Block until at least one task is queued or `timeout` elapses, then
    // run_pending().
    size_t wait_and_run(std::chrono::milliseconds timeout);

private:
    std::deque<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace locus
