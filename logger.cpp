#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
    }
    return "UNKNOWN";
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") { level = LogLevel::TRACE; return true; }
    if (lowered == "debug") { level = LogLevel::DEBUG; return true; }
    if (lowered == "info")  { level = LogLevel::INFO;  return true; }
    if (lowered == "warn" || lowered == "warning") { level = LogLevel::WARN; return true; }
    if (lowered == "error") { level = LogLevel::ERR;   return true; }
    return false;
}

Logger::Logger() {
    const char* fromEnv = std::getenv("LANQUEUE_LOG_LEVEL");
    if (fromEnv) {
        parseLogLevel(fromEnv, minLevel_);
    }
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

bool Logger::shouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    return level >= minLevel_;
}

void Logger::log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&nowTime, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    std::string ts = ss.str();

    std::lock_guard<std::mutex> lk(mu_);

    if (level >= minLevel_) {
        std::cerr << "[" << ts << "] [" << logLevelName(level) << "] " << msg << std::endl;
    }

    records_.push_back(LogRecord{level, ts, msg});
    if (records_.size() > maxRecords) {
        records_.pop_front();
    }
}

std::vector<LogRecord> Logger::recentLogs(size_t count) {
    std::lock_guard<std::mutex> lk(mu_);
    if (count >= records_.size()) {
        return std::vector<LogRecord>(records_.begin(), records_.end());
    }
    return std::vector<LogRecord>(records_.end() - static_cast<std::ptrdiff_t>(count), records_.end());
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    minLevel_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return minLevel_;
}
