#include "solo/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace solo {

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::init(const std::filesystem::path& logPath, bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;

    if (logFile_.is_open()) {
        logFile_.close();
    }
    if (logPath.empty()) {
        return;
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << logPath << std::endl;
        return;
    }
    logFile_ << "\n=== solo session started: " << timestamp() << " (pid " << getpid()
             << ") ===" << std::endl;
}

void Logger::setRole(const std::string& role) {
    std::lock_guard<std::mutex> lock(mutex_);
    role_ = role;
}

std::string Logger::formatLine(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    return formatLineLocked(level, message);
}

std::string Logger::formatLineLocked(LogLevel level, const std::string& message) const {
    // pid is read per line so a forked child tags its own output.
    std::string origin = std::to_string(getpid());
    if (!role_.empty()) {
        origin += " " + role_;
    }
    return "[" + timestamp() + "] [" + origin + "] [" + levelName(level) + "] " + message;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string line = formatLineLocked(level, message);

    if (logFile_.is_open()) {
        logFile_ << line << std::endl;
    }

    if (level == LogLevel::ERROR) {
        std::cerr << line << std::endl;
    } else if (verbose_ || level == LogLevel::WARNING) {
        std::cout << line << std::endl;
    }
}

} // namespace solo
