#include "task_executor.hpp"

#include <stdexcept>

namespace vault::server {

TaskExecutor::TaskExecutor(std::size_t worker_count, ErrorHandler on_error) : on_error_(std::move(on_error)) {
    start(worker_count);
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::start(std::size_t worker_count) {
    if (!workers_.empty()) {
        return;
    }
    if (worker_count == 0) {
        throw std::invalid_argument("worker_count must be > 0");
    }
    stopping_ = false;
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

void TaskExecutor::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("task executor is shutting down");
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

void TaskExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [&] { return tasks_.empty() && running_ == 0; });
}

void TaskExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<std::function<void()>> empty;
        std::swap(tasks_, empty);
    }
    idle_cv_.notify_all();
}

void TaskExecutor::worker_loop() {
    while (true) {
        std::function<void()> task;
        ErrorHandler on_error;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++running_;
            on_error = on_error_;
        }
        try {
            task();
        } catch (const std::exception& ex) {
            if (on_error) {
                on_error(ex);
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

}  // namespace vault::server
