#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace dock_dash {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string logger_name;
    std::thread::id thread_id;
    std::chrono::system_clock::time_point timestamp;
};

using LogSink = std::function<void(const LogMessage&)>;

class Logger {
public:
    static Logger* getInstance(const std::string& name = "default");
    static void resetInstance(const std::string& name = "default");

    // Applies a level to every logger created so far and to those created later
    static void setGlobalLevel(LogLevel level);

    ~Logger();

    // Configuration methods
    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    bool isLevelEnabled(LogLevel level) const;
    void setPattern(const std::string& pattern);
    void setConsoleSinkEnabled(bool enabled);

    // Logging methods
    template <typename... Args>
    void trace(const std::string& format, Args&&... args);

    template <typename... Args>
    void debug(const std::string& format, Args&&... args);

    template <typename... Args>
    void info(const std::string& format, Args&&... args);

    template <typename... Args>
    void warning(const std::string& format, Args&&... args);

    template <typename... Args>
    void error(const std::string& format, Args&&... args);

    template <typename... Args>
    void critical(const std::string& format, Args&&... args);

    // Sink management
    void addSink(LogSink sink, LogLevel level = LogLevel::TRACE);
    // Appends to file_path, creating its directory; throws ContainerError(IO_ERROR) on failure
    void addFileSink(const std::filesystem::path& file_path, LogLevel level = LogLevel::INFO);
    void removeFileSink(const std::filesystem::path& file_path);
    void clearSinks();

    void flush();
    std::string getName() const;

private:
    explicit Logger(const std::string& name);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string formatMessage(const LogMessage& message) const;

    template <typename... Args>
    static std::string formatString(const std::string& format, Args&&... args);

    static std::unordered_map<std::string, std::unique_ptr<Logger>> instances_;
    static std::mutex instances_mutex_;
    static std::atomic<LogLevel> global_level_;

    struct SinkInfo {
        LogSink sink;
        LogLevel level;
    };

    struct FileSink {
        std::unique_ptr<std::ofstream> stream;
        LogLevel level;
    };

    std::string name_;
    std::atomic<LogLevel> level_;
    std::string pattern_;
    std::atomic<bool> console_sink_enabled_;

    std::vector<SinkInfo> sinks_;
    std::unordered_map<std::string, FileSink> file_sinks_;
    mutable std::mutex pattern_mutex_;
    std::mutex sinks_mutex_;
    std::mutex console_mutex_;
};

// Utility functions
std::string toString(LogLevel level);
LogLevel fromString(const std::string& level_str);

// Template implementations
template <typename... Args>
void Logger::trace(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::TRACE)) {
        log(LogLevel::TRACE, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::debug(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::info(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::INFO)) {
        log(LogLevel::INFO, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::warning(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::WARNING)) {
        log(LogLevel::WARNING, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::error(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::ERROR)) {
        log(LogLevel::ERROR, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void Logger::critical(const std::string& format, Args&&... args)
{
    if (isLevelEnabled(LogLevel::CRITICAL)) {
        log(LogLevel::CRITICAL, formatString(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
std::string Logger::formatString(const std::string& format, Args&&... args)
{
    // Each argument replaces the next {} placeholder; extra arguments are ignored
    std::string result = format;
    size_t pos = 0;
    auto format_arg = [&](auto&& arg) {
        size_t brace_pos = result.find("{}", pos);
        if (brace_pos != std::string::npos) {
            std::ostringstream oss;
            oss << arg;
            result.replace(brace_pos, 2, oss.str());
            pos = brace_pos + oss.str().length();
        }
    };

    (format_arg(args), ...);
    (void)format_arg;

    return result;
}

} // namespace dock_dash
