#include <algorithm>
#include <cctype>
#include <ctime>
#include <dtop/core/error.hpp>
#include <dtop/core/logger.hpp>
#include <iomanip>
#include <iostream>

namespace dtop {

std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::instances_;
std::mutex Logger::instances_mutex_;

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

Logger::Logger(std::string name)
    : name_(std::move(name)), level_(LogLevel::INFO), pattern_("%t [%l] %n: %v"),
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

void Logger::setFileSink(const std::filesystem::path& file_path, LogLevel level)
{
    std::filesystem::path dir = file_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw DtopError(ErrorCode::IO_ERROR,
                            "Failed to create log directory " + dir.string() + ": " + ec.message());
        }
    }

    auto stream = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!stream->is_open()) {
        throw DtopError(ErrorCode::IO_ERROR, "Failed to open log file: " + file_path.string());
    }

    std::lock_guard<std::mutex> lock(file_mutex_);
    file_stream_ = std::move(stream);
    file_level_ = level;
}

void Logger::clearSinks()
{
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.clear();
    }

    std::lock_guard<std::mutex> file_lock(file_mutex_);
    file_stream_.reset();
}

void Logger::flush()
{
    std::lock_guard<std::mutex> file_lock(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

std::string Logger::getName() const
{
    return name_;
}

void Logger::log(LogLevel level, const std::string& message)
{
    LogMessage log_message;
    log_message.level = level;
    log_message.message = message;
    log_message.logger_name = name_;
    log_message.thread_id = std::this_thread::get_id();
    log_message.timestamp = std::chrono::system_clock::now();

    if (console_sink_enabled_) {
        std::cerr << formatMessage(log_message) << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        if (file_stream_ && file_stream_->is_open() && level >= file_level_) {
            *file_stream_ << formatMessage(log_message) << '\n';
            if (level >= LogLevel::WARNING) {
                file_stream_->flush();
            }
        }
    }

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink_info : sinks_) {
        if (level >= sink_info.level) {
            sink_info.sink(log_message);
        }
    }
}

std::string Logger::formatMessage(const LogMessage& message) const
{
    std::string result;
    result.reserve(pattern_.size() + message.message.size() + 32);

    for (size_t i = 0; i < pattern_.size(); ++i) {
        if (pattern_[i] != '%' || i + 1 == pattern_.size()) {
            result += pattern_[i];
            continue;
        }

        char token = pattern_[++i];
        switch (token) {
            case 'l':
                result += toString(message.level);
                break;
            case 'n':
                result += message.logger_name;
                break;
            case 'v':
                result += message.message;
                break;
            case 't': {
                auto time_t = std::chrono::system_clock::to_time_t(message.timestamp);
                std::tm local_tm{};
                localtime_r(&time_t, &local_tm);
                std::ostringstream time_stream;
                time_stream << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
                result += time_stream.str();
                break;
            }
            case 'T': {
                std::ostringstream thread_stream;
                thread_stream << message.thread_id;
                result += thread_stream.str();
                break;
            }
            default:
                result += '%';
                result += token;
                break;
        }
    }

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

LogLevel logLevelFromString(const std::string& level_str)
{
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

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

} // namespace dtop
