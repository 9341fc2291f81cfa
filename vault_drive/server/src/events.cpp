#include "events.hpp"

namespace vault::server {

void LocalEventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void LocalEventBus::publish(const BytesReceived& event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }
    for (const auto& handler : handlers) {
        handler(event);
    }
}

}  // namespace vault::server
