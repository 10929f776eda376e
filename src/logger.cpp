#include "logger.h"

#include <cstdarg>
#include <cstdio>
#include <vector>

Logger &Logger::instance()
{
    static Logger s_instance;
    return s_instance;
}

void Logger::setVerbose(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_verbose = enabled;
}

void Logger::setDebug(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_debug = enabled;
}

bool Logger::verboseEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_verbose;
}

bool Logger::debugEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_debug;
}

void Logger::setSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sink = std::move(sink);
}

bool Logger::shouldLog(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return shouldLogLocked(level);
}

bool Logger::shouldLogLocked(LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Error:
    case LogLevel::Warn:
    case LogLevel::Info:
        return true;
    case LogLevel::Verbose:
        return m_verbose || m_debug;
    case LogLevel::Debug:
        return m_debug;
    default:
        return false;
    }
}

const char *Logger::prefix(LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Error:
        return "[ERROR] ";
    case LogLevel::Warn:
        return "[WARN] ";
    case LogLevel::Info:
        return "[INFO] ";
    case LogLevel::Verbose:
        return "[VERBOSE] ";
    case LogLevel::Debug:
        return "[DEBUG] ";
    default:
        return "";
    }
}

void Logger::log(LogLevel level, const char *fmt, ...) noexcept
{
    va_list args;
    va_start(args, fmt);
    logv(level, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char *fmt, va_list args) noexcept
{
    if (!fmt)
        return;

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!shouldLogLocked(level))
            return;

        if (!m_sink)
        {
            std::fputs(prefix(level), stderr);
            std::vfprintf(stderr, fmt, args);
            std::fputc('\n', stderr);
            std::fflush(stderr);
            return;
        }
        sink = m_sink;
    }

    // The sink runs unlocked so it may log or reconfigure the logger itself
    va_list measure;
    va_copy(measure, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);
    if (needed < 0)
        return;

    try
    {
        std::vector<char> buf(static_cast<size_t>(needed) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, args);
        sink(level, std::string(buf.data(), static_cast<size_t>(needed)));
    }
    catch (const std::exception &ex)
    {
        std::fprintf(stderr, "[ERROR] log sink failed: %s\n", ex.what());
    }
}
