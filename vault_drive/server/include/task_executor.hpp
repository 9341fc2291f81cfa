#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace vault::server {

class TaskExecutor {
public:
    using ErrorHandler = std::function<void(const std::exception&)>;

    explicit TaskExecutor(std::size_t worker_count, ErrorHandler on_error = nullptr);
    ~TaskExecutor();

    void submit(std::function<void()> task);
    // Blocks until the queue is empty and no task is running.
    void wait_idle();
    void shutdown();

private:
    void start(std::size_t worker_count);
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::size_t running_{0};
    bool stopping_{false};
    ErrorHandler on_error_;
};

}  // namespace vault::server
