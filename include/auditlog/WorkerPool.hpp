#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace auditlog {

// Fixed set of threads over a bounded FIFO queue.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(std::size_t workers, std::size_t capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Never blocks. False when the queue is full or the pool is stopped.
    bool trySubmit(Task task);

    // Blocks until the queue is empty and no task is running.
    void waitIdle();

    // Runs what is already queued, then joins the workers.
    void stop();

    std::size_t workerCount() const { return threads_.size(); }
    std::size_t capacity() const { return capacity_; }
    std::size_t pending() const;

private:
    void workerLoop();

    std::size_t capacity_;
    std::vector<std::thread> threads_;
    std::deque<Task> queue_;
    std::size_t running_ = 0;
    bool stopping_ = false;
    mutable std::mutex mutex_;
    std::condition_variable workCv_;
    std::condition_variable idleCv_;
};

} // namespace auditlog
