#include <algorithm>
#include <ctime>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace dock_dash {

std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::instances_;
std::mutex Logger::instances_mutex_;
std::atomic<LogLevel> Logger::global_level_{LogLevel::INFO};

namespace {

void replaceToken(std::string& text, const std::string& token, const std::string& value)
{
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.length(), value);
        pos += value.length();
    }
}

std::string formatTimestamp(std::chrono::system_clock::time_point timestamp)
{
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream time_stream;
    time_stream << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return time_stream.str();
}

} // namespace

Logger* Logger::getInstance(const std::string& name)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);

    auto it = instances_.find(name);
    if (it == instances_.end()) {
        it = instances_.emplace(name, std::unique_ptr<Logger>(new Logger(name))).first;
    }

    return it->second.get();
}

void Logger::resetInstance(const std::string& name)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);
    instances_.erase(name);
}

void Logger::setGlobalLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(instances_mutex_);
    global_level_ = level;
    for (auto& [name, logger] : instances_) {
        logger->setLevel(level);
    }
}

Logger::Logger(const std::string& name)
    : name_(name), level_(global_level_.load()), pattern_("[%l] %n: %v"), // [level] name: message
      console_sink_enabled_(true)
{}

Logger::~Logger()
{
    flush();
}

void Logger::setLevel(LogLevel level)
{
    level_ = level;
}

LogLevel Logger::getLevel() const
{
    return level_;
}

bool Logger::isLevelEnabled(LogLevel level) const
{
    return level >= level_.load();
}

void Logger::setPattern(const std::string& pattern)
{
    std::lock_guard<std::mutex> lock(pattern_mutex_);
    pattern_ = pattern;
}

void Logger::setConsoleSinkEnabled(bool enabled)
{
    console_sink_enabled_ = enabled;
}

void Logger::addSink(LogSink sink, LogLevel level)
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back({std::move(sink), level});
}

void Logger::addFileSink(const std::filesystem::path& file_path, LogLevel level)
{
    std::filesystem::path dir = file_path.parent_path();
    std::error_code ec;
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw makeSystemError(ErrorCode::IO_ERROR,
                                  std::system_error(ec, "Cannot create log directory " + dir.string()));
        }
    }

    auto stream = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!stream->is_open()) {
        throw ContainerError(ErrorCode::IO_ERROR, "Failed to open log file: " + file_path.string());
    }

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    file_sinks_[file_path.string()] = FileSink{std::move(stream), level};
}

void Logger::removeFileSink(const std::filesystem::path& file_path)
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    auto it = file_sinks_.find(file_path.string());
    if (it != file_sinks_.end()) {
        it->second.stream->flush();
        file_sinks_.erase(it);
    }
}

void Logger::clearSinks()
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
    file_sinks_.clear();
}

void Logger::flush()
{
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (auto& [path, file_sink] : file_sinks_) {
            if (file_sink.stream && file_sink.stream->is_open()) {
                file_sink.stream->flush();
            }
        }
    }
    std::lock_guard<std::mutex> console_lock(console_mutex_);
    std::cout.flush();
}

std::string Logger::getName() const
{
    return name_;
}

void Logger::log(LogLevel level, const std::string& message)
{
    if (!isLevelEnabled(level)) {
        return;
    }

    LogMessage log_message;
    log_message.level = level;
    log_message.message = message;
    log_message.logger_name = name_;
    log_message.thread_id = std::this_thread::get_id();
    log_message.timestamp = std::chrono::system_clock::now();

    const std::string formatted = formatMessage(log_message);

    if (console_sink_enabled_) {
        std::lock_guard<std::mutex> console_lock(console_mutex_);
        std::cout << formatted << std::endl;
    }

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink_info : sinks_) {
        if (level >= sink_info.level) {
            sink_info.sink(log_message);
        }
    }
    for (auto& [path, file_sink] : file_sinks_) {
        if (level >= file_sink.level && file_sink.stream->is_open()) {
            *file_sink.stream << formatted << '\n';
        }
    }
}

std::string Logger::formatMessage(const LogMessage& message) const
{
    std::string result;
    {
        std::lock_guard<std::mutex> lock(pattern_mutex_);
        result = pattern_;
    }

    // %v goes last so tokens inside the message text are left alone
    replaceToken(result, "%l", toString(message.level));
    replaceToken(result, "%n", message.logger_name);
    replaceToken(result, "%t", formatTimestamp(message.timestamp));

    std::ostringstream thread_stream;
    thread_stream << message.thread_id;
    replaceToken(result, "%T", thread_stream.str());

    replaceToken(result, "%v", message.message);
    return result;
}

std::string toString(LogLevel level)
{
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::CRITICAL:
            return "CRITICAL";
        default:
            return "UNKNOWN";
    }
}

LogLevel fromString(const std::string& level_str)
{
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(), ::toupper);

    if (upper_str == "TRACE")
        return LogLevel::TRACE;
    if (upper_str == "DEBUG")
        return LogLevel::DEBUG;
    if (upper_str == "INFO")
        return LogLevel::INFO;
    if (upper_str == "WARNING" || upper_str == "WARN")
        return LogLevel::WARNING;
    if (upper_str == "ERROR")
        return LogLevel::ERROR;
    if (upper_str == "CRITICAL")
        return LogLevel::CRITICAL;

    // Default to INFO for invalid strings
    return LogLevel::INFO;
}

} // namespace dock_dash
