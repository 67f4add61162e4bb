#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define __RELATIVE_FILEPATH__                                  \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
#ifdef _WIN32
        localtime_s(&tm_now, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_now);
#endif

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

    static const char*
    level_tag(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::ERROR:
                return "[ERROR] ";
            case LogLevel::WARNING:
                return "[WARN]  ";
            case LogLevel::INFO:
                return "[INFO]  ";
            case LogLevel::DEBUG:
                return "[DEBUG] ";
            default:
                return "";
        }
    }

public:
    static void
    set_level(LogLevel level);

    /**
     * Set the level from its name ("error", "warn", "warning", "info",
     * "debug", any case).
     *
     * @return false if the name is not a known level
     */
    static bool
    set_level(const std::string& level);

    // The level a name stands for, nullopt if it names none
    static std::optional<LogLevel>
    parse_level(const std::string& level);

    static LogLevel
    get_level();

    // nullptr restores std::cout / std::cerr
    static void
    set_output_stream(std::ostream* output_stream);

    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;

        // Format before taking the lock
        std::ostringstream oss;
        oss << format_timestamp() << level_tag(level);
        (oss << ... << args);

        std::lock_guard<std::mutex> lock(log_mutex_);
        std::ostream* out = (level <= LogLevel::WARNING)
            ? (error_stream_ ? error_stream_ : &std::cerr)
            : (output_stream_ ? output_stream_ : &std::cout);
        *out << oss.str() << std::endl;
    }
};

/**
 * Named logging channel with its own level.
 *
 * A partition created with LogLevel::INHERIT follows the global Logger level,
 * otherwise it filters on its own level. Use with the PLOG* macros.
 */
class LogPartition
{
public:
    LogPartition(std::string name, LogLevel level = LogLevel::INHERIT)
        : name_(std::move(name)), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

private:
    std::string name_;
    LogLevel level_;
};

#define LOGE(...)              \
    Logger::log(               \
        LogLevel::ERROR,       \
        __VA_ARGS__,           \
        " (",                  \
        __RELATIVE_FILEPATH__, \
        ":",                   \
        __LINE__,              \
        ")")
#define LOGW(...)                                 \
    if (Logger::get_level() >= LogLevel::WARNING) \
    Logger::log(                                  \
        LogLevel::WARNING,                        \
        __VA_ARGS__,                              \
        " (",                                     \
        __RELATIVE_FILEPATH__,                    \
        ":",                                      \
        __LINE__,                                 \
        ")")
#define LOGI(...)                              \
    if (Logger::get_level() >= LogLevel::INFO) \
    Logger::log(                               \
        LogLevel::INFO,                        \
        __VA_ARGS__,                           \
        " (",                                  \
        __RELATIVE_FILEPATH__,                 \
        ":",                                   \
        __LINE__,                              \
        ")")
#define LOGD(...)                               \
    if (Logger::get_level() >= LogLevel::DEBUG) \
    Logger::log(                                \
        LogLevel::DEBUG,                        \
        __VA_ARGS__,                            \
        " (",                                   \
        __RELATIVE_FILEPATH__,                  \
        ":",                                    \
        __LINE__,                               \
        ")")

// Partition-aware variants. Logger::log still applies the global level, so a
// partition can only narrow what the global level lets through.
#define CDB_PLOG_IMPL(level_value, partition, ...) \
    if ((partition).should_log(level_value))       \
    Logger::log(                                   \
        level_value,                               \
        "[",                                       \
        (partition).name(),                        \
        "] ",                                      \
        __VA_ARGS__,                               \
        " (",                                      \
        __RELATIVE_FILEPATH__,                     \
        ":",                                       \
        __LINE__,                                  \
        ")")

#define PLOGE(partition, ...) \
    CDB_PLOG_IMPL(LogLevel::ERROR, partition, __VA_ARGS__)
#define PLOGW(partition, ...) \
    CDB_PLOG_IMPL(LogLevel::WARNING, partition, __VA_ARGS__)
#define PLOGI(partition, ...) \
    CDB_PLOG_IMPL(LogLevel::INFO, partition, __VA_ARGS__)
#define PLOGD(partition, ...) \
    CDB_PLOG_IMPL(LogLevel::DEBUG, partition, __VA_ARGS__)
