#include <cstddef>
#include <cstdint>
#include <mutex>
#include <deque>
#include <string>
#include <vector>

#ifndef LOGGER_HPP
#define LOGGER_HPP

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR
};

struct LogRecord {
    LogLevel level;
    std::string timestamp;
    std::string message;
};

class Logger {
public:
    static Logger& get();

    bool shouldLog(LogLevel level) const;
    void log(LogLevel level, const std::string& msg);
    std::vector<LogRecord> recentLogs(size_t count = maxRecords);
    void setLevel(LogLevel level);
    LogLevel level() const;

    static constexpr size_t maxRecords = 100;

private:
    Logger();
    mutable std::mutex mu_;
    LogLevel minLevel_ = LogLevel::INFO;
    std::deque<LogRecord> records_;
};

const char* logLevelName(LogLevel level);

// Accepts trace/debug/info/warn/error in any case. Returns false if unknown.
bool parseLogLevel(const std::string& text, LogLevel& level);

#define LOG_AT_LEVEL(level, msg) \
    do { if (Logger::get().shouldLog(level)) Logger::get().log(level, msg); } while (0)

#define LOG_TRACE(msg) LOG_AT_LEVEL(LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) LOG_AT_LEVEL(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  LOG_AT_LEVEL(LogLevel::INFO, msg)
#define LOG_WARN(msg)  LOG_AT_LEVEL(LogLevel::WARN, msg)
#define LOG_ERROR(msg) LOG_AT_LEVEL(LogLevel::ERR, msg)

#endif // LOGGER_HPP
