
#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace streammux {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    // Defaults to stderr. The caller keeps ownership of the FILE.
    void set_output(std::FILE* out);
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    std::FILE* out_ = nullptr;
    const char* level_str(LogLevel lvl);
};

} // namespace streammux
