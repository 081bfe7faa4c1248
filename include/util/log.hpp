#ifndef LOG_HPP
#define LOG_HPP

#include <string>
#include <utility>
#include <fmt/format.h>

enum class LogLevel
{
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

namespace logging
{
    // Directs log output to the given file (appending). Returns false if it cannot be opened,
    // in which case the previous sink stays in place.
    bool openFile(const std::string &path);

    void setLevel(LogLevel level);
    LogLevel getLevel();

    void write(LogLevel level, const std::string &message);

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args &&...args)
    {
        if (level < getLevel())
            return;

        write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }
}

#endif
