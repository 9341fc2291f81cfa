#include "postprocessing_driver.hpp"

#include "logger.hpp"
#include "upload_engine.hpp"

#include <algorithm>

namespace vault::server {

PostprocessingDriver::PostprocessingDriver(UploadEngine& engine, Logger& logger, std::size_t worker_count)
    : engine_(engine),
      logger_(logger),
      executor_(std::max<std::size_t>(worker_count, 1), [this](const std::exception& ex) {
          logger_.error(std::string("post-processing task failed: ") + ex.what());
      }) {}

void PostprocessingDriver::attach(LocalEventBus& bus) {
    bus.subscribe([this](const BytesReceived& event) { schedule(event.upload_id); });
}

void PostprocessingDriver::schedule(const std::string& upload_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_.insert(upload_id).second) {
            return;
        }
    }
    try {
        executor_.submit([this, upload_id]() { run(upload_id); });
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(upload_id);
        throw;
    }
}

std::size_t PostprocessingDriver::resume_pending() {
    const auto pending = engine_.pending_postprocessing();
    for (const auto& session : pending) {
        logger_.info("resuming post-processing of upload " + session.id);
        schedule(session.id);
    }
    return pending.size();
}

void PostprocessingDriver::wait_idle() {
    executor_.wait_idle();
}

void PostprocessingDriver::run(const std::string& upload_id) {
    try {
        auto upload = engine_.get_upload(upload_id);
        upload->resume_postprocessing();
    } catch (const std::exception& ex) {
        logger_.error("post-processing of upload " + upload_id + " failed: " + ex.what());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(upload_id);
}

}  // namespace vault::server
