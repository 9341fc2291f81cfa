#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace vault::server {

struct ResourceId {
    std::string space_id;
    std::string opaque_id;
};

struct BytesReceived {
    std::string upload_id;
    std::string url;
    std::string space_owner;
    std::string executing_user;
    ResourceId resource_id;
    std::string filename;
    std::uint64_t filesize = 0;
};

class EventPublisher {
public:
    virtual ~EventPublisher() = default;
    virtual void publish(const BytesReceived& event) = 0;
};

// Delivers events to in-process subscribers on the publishing thread.
class LocalEventBus : public EventPublisher {
public:
    using Handler = std::function<void(const BytesReceived&)>;

    void subscribe(Handler handler);
    void publish(const BytesReceived& event) override;

private:
    std::mutex mutex_;
    std::vector<Handler> handlers_;
};

}  // namespace vault::server
