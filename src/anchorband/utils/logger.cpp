#include <anchorband/utils/logger.hpp>
#include <iostream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace anchorband::utils {

std::mutex Logger::console_mutex_;
std::atomic<LogLevel> Logger::current_level_{LogLevel::INFO};

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "[DEBUG] ";
        case LogLevel::INFO:
            return "[INFO] ";
        case LogLevel::WARN:
            return "[WARN] ";
        case LogLevel::LOG_ERROR:
            return "[ERROR] ";
    }
    return "";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::stringstream time_str;
    time_str << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    time_str << '.' << std::setfill('0') << std::setw(3) << ms;
    return time_str.str();
}

} // namespace

Logger::Logger(LogLevel level) : level_(level) {}

// One buffer per thread and level; the gateway receiver logs concurrently with the run
Logger& Logger::begin(LogLevel level) {
    static thread_local Logger debug_logger(LogLevel::DEBUG);
    static thread_local Logger info_logger(LogLevel::INFO);
    static thread_local Logger warn_logger(LogLevel::WARN);
    static thread_local Logger error_logger(LogLevel::LOG_ERROR);

    Logger* logger = &info_logger;
    switch (level) {
        case LogLevel::DEBUG:
            logger = &debug_logger;
            break;
        case LogLevel::INFO:
            break;
        case LogLevel::WARN:
            logger = &warn_logger;
            break;
        case LogLevel::LOG_ERROR:
            logger = &error_logger;
            break;
    }
    logger->stream_.str("");
    logger->stream_.clear();
    return *logger;
}

Logger& Logger::debug() {
    return begin(LogLevel::DEBUG);
}

Logger& Logger::info() {
    return begin(LogLevel::INFO);
}

Logger& Logger::warn() {
    return begin(LogLevel::WARN);
}

Logger& Logger::error() {
    return begin(LogLevel::LOG_ERROR);
}

Logger& Logger::operator<<(const EndlType&) {
    if (level_ < current_level_.load()) {
        return *this;
    }

    std::string stamp = timestamp();
    std::lock_guard<std::mutex> lock(console_mutex_);
    std::cout << "[" << stamp << "] " << level_tag(level_) << stream_.str() << std::endl;
    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_.store(level);
}

LogLevel Logger::level() {
    return current_level_.load();
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::DEBUG;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::WARN;
    }
    if (lowered == "error") {
        return LogLevel::LOG_ERROR;
    }
    return LogLevel::INFO;
}

} // namespace anchorband::utils
