#pragma once

#include <cstdarg>
#include <functional>
#include <mutex>
#include <string>

enum class LogLevel
{
    Error,
    Warn,
    Info,
    Verbose,
    Debug
};

// Receives fully formatted messages instead of stderr when installed.
using LogSink = std::function<void(LogLevel, const std::string &)>;

class Logger
{
public:
    static Logger &instance();

    void setVerbose(bool enabled);
    void setDebug(bool enabled);

    bool verboseEnabled() const;
    bool debugEnabled() const;

    // Pass an empty sink to restore stderr output.
    void setSink(LogSink sink);

    void log(LogLevel level, const char *fmt, ...) noexcept;
    void logv(LogLevel level, const char *fmt, va_list args) noexcept;

    bool shouldLog(LogLevel level) const;

private:
    Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    bool shouldLogLocked(LogLevel level) const;
    const char *prefix(LogLevel level) const;

    mutable std::mutex m_mutex;
    bool m_verbose = false;
    bool m_debug = false;
    LogSink m_sink;
};

#define LOG_ERROR(...) Logger::instance().log(LogLevel::Error, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log(LogLevel::Warn, __VA_ARGS__)
#define LOG_INFO(...) Logger::instance().log(LogLevel::Info, __VA_ARGS__)
#define LOG_VERBOSE(...) Logger::instance().log(LogLevel::Verbose, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log(LogLevel::Debug, __VA_ARGS__)
