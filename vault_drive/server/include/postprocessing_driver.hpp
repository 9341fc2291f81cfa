#pragma once

#include "events.hpp"
#include "task_executor.hpp"

#include <cstddef>
#include <mutex>
#include <set>
#include <string>

namespace vault::server {

class Logger;
class UploadEngine;

// Finishes uploads committed in asynchronous mode: moves their bytes into the blob store
// and cleans up, on a pool of worker threads owned by the driver.
class PostprocessingDriver {
public:
    PostprocessingDriver(UploadEngine& engine, Logger& logger, std::size_t worker_count);

    // Schedules post-processing for every BytesReceived published on `bus`.
    void attach(LocalEventBus& bus);
    void schedule(const std::string& upload_id);
    // Schedules uploads left pending by an earlier process. Returns how many were scheduled.
    std::size_t resume_pending();
    void wait_idle();

private:
    void run(const std::string& upload_id);

    UploadEngine& engine_;
    Logger& logger_;
    std::mutex mutex_;
    std::set<std::string> in_flight_;
    // Last member: joined before the state its tasks touch is destroyed.
    TaskExecutor executor_;
};

}  // namespace vault::server
