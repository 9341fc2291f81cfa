#include "tracer.hpp"

#include "logger.hpp"

#include <utility>

namespace vault::server {

Span::Span(std::string name, EndCallback on_end)
    : name_(std::move(name)), on_end_(std::move(on_end)), started_(std::chrono::steady_clock::now()) {}

Span::~Span() {
    end();
}

Span::Span(Span&& other) noexcept
    : name_(std::move(other.name_)), on_end_(std::move(other.on_end_)), started_(other.started_) {
    other.on_end_ = nullptr;
}

Span& Span::operator=(Span&& other) noexcept {
    if (this != &other) {
        end();
        name_ = std::move(other.name_);
        on_end_ = std::move(other.on_end_);
        started_ = other.started_;
        other.on_end_ = nullptr;
    }
    return *this;
}

void Span::end() {
    if (!on_end_) {
        return;
    }
    auto callback = std::move(on_end_);
    on_end_ = nullptr;
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_);
    callback(name_, elapsed);
}

Span NullTracer::start_span(const std::string& name) {
    return Span(name, nullptr);
}

LogTracer::LogTracer(Logger& logger, std::string scope) : logger_(logger), scope_(std::move(scope)) {}

Span LogTracer::start_span(const std::string& name) {
    if (!logger_.enabled(LogLevel::kDebug)) {
        return Span(name, nullptr);
    }
    return Span(name, [this](const std::string& span_name, std::chrono::microseconds elapsed) {
        logger_.debug("span " + scope_ + "/" + span_name + " took " + std::to_string(elapsed.count()) + "us");
    });
}

}  // namespace vault::server
