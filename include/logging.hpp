
#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace ecdigest {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

} // namespace ecdigest
