#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace tftpc {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel lvl) const { return lvl >= level_ && lvl != LogLevel::OFF; }
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    const char* level_str(LogLevel lvl);
};

bool parse_log_level(const std::string& name, LogLevel& lvl);

} // namespace tftpc
