#include "auditlog/WorkerPool.hpp"

#include <algorithm>
#include <iostream>

namespace auditlog {

WorkerPool::WorkerPool(std::size_t workers, std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {
    workers = std::max<std::size_t>(1, workers);
    threads_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads_.emplace_back([this] { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::trySubmit(Task task) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_ || queue_.size() >= capacity_) return false;
        queue_.push_back(std::move(task));
    }
    workCv_.notify_one();
    return true;
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lk(mutex_);
    idleCv_.wait(lk, [this] { return queue_.empty() && running_ == 0; });
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    workCv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return queue_.size();
}

void WorkerPool::workerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            workCv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return; // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "WorkerPool: task failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "WorkerPool: task failed with unknown error\n";
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            --running_;
            if (queue_.empty() && running_ == 0) idleCv_.notify_all();
        }
    }
}

} // namespace auditlog
