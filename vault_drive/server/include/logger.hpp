#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace vault::server {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

LogLevel parse_log_level(std::string_view value);

class Logger {
public:
    explicit Logger(const std::string& file_path, LogLevel min_level = LogLevel::kInfo, bool mirror_to_console = true);

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::kDebug, message); }
    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

    bool enabled(LogLevel level) const { return level >= min_level_; }

private:
    std::string level_to_string(LogLevel level) const;
    void ensure_stream();

    std::mutex mutex_;
    std::ofstream stream_;
    std::string file_path_;
    LogLevel min_level_;
    bool mirror_to_console_;
};

}  // namespace vault::server
