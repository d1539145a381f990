#pragma once

#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>

namespace routecore {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    // Case-insensitive; unknown names map to INFO.
    LogLevel ParseLevel(const std::string& levelStr) const;

    // Defaults to std::cerr with ANSI colors. Pass nullptr to restore the default.
    void SetOutput(std::ostream* out);
    void SetColor(bool on);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    std::ostream* out_{nullptr};
    bool color_{true};
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "deployment " << id << " cooling";
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace routecore

#define ROUTECORE_LOG(level) \
    if (routecore::common::LogLevel::level >= routecore::common::Logger::Instance().GetLevel()) \
    routecore::common::LogStream(routecore::common::LogLevel::level, __FILE__, __LINE__)

#define LOG_DEBUG ROUTECORE_LOG(DEBUG)
#define LOG_INFO ROUTECORE_LOG(INFO)
#define LOG_WARN ROUTECORE_LOG(WARN)
#define LOG_ERROR ROUTECORE_LOG(ERROR)
#define LOG_FATAL ROUTECORE_LOG(FATAL)
