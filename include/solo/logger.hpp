#ifndef SOLO_LOGGER_HPP
#define SOLO_LOGGER_HPP

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace solo {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Process-wide log sink. Primaries and secondaries of one identity usually
// append to the same file, so each line carries the pid and the role:
//
//   [2026-10-19 14:02:11] [31337 primary] [INFO] Channel bound at ...
class Logger {
public:
    static Logger& instance();

    // Opens logPath in append mode. An empty path keeps console-only logging.
    void init(const std::filesystem::path& logPath, bool verbose);

    // Tag written next to the pid, e.g. "primary" or "secondary".
    void setRole(const std::string& role);

    void log(LogLevel level, const std::string& message);

    std::string formatLine(LogLevel level, const std::string& message);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::string formatLineLocked(LogLevel level, const std::string& message) const;

    std::ofstream logFile_;
    bool verbose_ = false;
    std::string role_;
    std::mutex mutex_;
};

#define LOG_DEBUG(msg) solo::Logger::instance().log(solo::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) solo::Logger::instance().log(solo::LogLevel::INFO, msg)
#define LOG_WARN(msg) solo::Logger::instance().log(solo::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) solo::Logger::instance().log(solo::LogLevel::ERROR, msg)

} // namespace solo

#endif // SOLO_LOGGER_HPP
