#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace vault::server {

class Logger;

// Move-only scope handle; the span ends when the handle is destroyed or end() is called.
class Span {
public:
    using EndCallback = std::function<void(const std::string&, std::chrono::microseconds)>;

    Span() = default;
    Span(std::string name, EndCallback on_end);
    ~Span();

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;
    Span(Span&& other) noexcept;
    Span& operator=(Span&& other) noexcept;

    void end();
    const std::string& name() const { return name_; }

private:
    std::string name_;
    EndCallback on_end_;
    std::chrono::steady_clock::time_point started_{};
};

class Tracer {
public:
    virtual ~Tracer() = default;
    virtual Span start_span(const std::string& name) = 0;
};

class NullTracer : public Tracer {
public:
    Span start_span(const std::string& name) override;
};

class LogTracer : public Tracer {
public:
    LogTracer(Logger& logger, std::string scope);
    Span start_span(const std::string& name) override;

private:
    Logger& logger_;
    std::string scope_;
};

}  // namespace vault::server
