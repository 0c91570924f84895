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

namespace dtop {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARNING = 3, ERROR = 4, CRITICAL = 5 };

struct LogMessage {
    LogLevel level;
    std::string message;
    std::string logger_name;
    std::thread::id thread_id;
    std::chrono::system_clock::time_point timestamp;
};

using LogSink = std::function<void(const LogMessage&)>;

/**
 * @brief Named, process-wide loggers
 *
 * The terminal belongs to the renderer while the dashboard runs, so the
 * console sink writes to stderr and is switched off by main() before the
 * UI starts; a file sink receives everything from then on.
 */
class Logger {
public:
    static Logger* getInstance(const std::string& name = "dtop");
    static void resetInstance(const std::string& name = "dtop");

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
    void setFileSink(const std::filesystem::path& file_path, LogLevel level = LogLevel::TRACE);
    void clearSinks();

    void flush();
    std::string getName() const;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

private:
    explicit Logger(std::string name);

    void log(LogLevel level, const std::string& message);
    std::string formatMessage(const LogMessage& message) const;

    template <typename... Args>
    static std::string formatString(const std::string& format, Args&&... args);

    static std::unordered_map<std::string, std::unique_ptr<Logger>> instances_;
    static std::mutex instances_mutex_;

    std::string name_;
    std::atomic<LogLevel> level_;
    std::string pattern_;
    std::atomic<bool> console_sink_enabled_;

    struct SinkInfo {
        LogSink sink;
        LogLevel level;
    };

    std::vector<SinkInfo> sinks_;
    std::mutex sinks_mutex_;

    // A single file sink; replacing it closes the previous stream.
    std::unique_ptr<std::ofstream> file_stream_;
    LogLevel file_level_ = LogLevel::TRACE;
    std::mutex file_mutex_;
};

std::string toString(LogLevel level);
LogLevel logLevelFromString(const std::string& level_str);

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
    // Replace {} placeholders one by one
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

    return result;
}

} // namespace dtop
