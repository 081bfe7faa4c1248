#include <cstdio>
#include <ctime>
#include <mutex>
#include <atomic>

#include "util/log.hpp"

namespace
{
    std::mutex sinkMutex;
    std::FILE *sink = nullptr; // nullptr means stderr
    std::atomic<LogLevel> threshold{LogLevel::WARN};

    const char *levelName(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        default:
            return "";
        }
    }

    void closeSink()
    {
        if (sink)
        {
            std::fclose(sink);
            sink = nullptr;
        }
    }
}

namespace logging
{
    bool openFile(const std::string &path)
    {
        std::FILE *file = std::fopen(path.c_str(), "a");
        if (!file)
        {
            return false;
        }

        std::lock_guard<std::mutex> lock(sinkMutex);
        closeSink();
        sink = file;
        return true;
    }

    void setLevel(LogLevel level)
    {
        threshold.store(level);
    }

    LogLevel getLevel()
    {
        return threshold.load();
    }

    // Writes one timestamped line: YYYY-MM-DD HH:MM:SS [LEVEL] message
    void write(LogLevel level, const std::string &message)
    {
        if (level < getLevel() || level == LogLevel::OFF)
            return;

        char stamp[20];
        time_t now = std::time(nullptr);
        struct tm timeinfo{};
        localtime_r(&now, &timeinfo);
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &timeinfo);

        std::string line = fmt::format("{} [{}] {}\n", stamp, levelName(level), message);

        std::lock_guard<std::mutex> lock(sinkMutex);
        std::FILE *out = sink ? sink : stderr;
        std::fputs(line.c_str(), out);
        std::fflush(out);
    }
}
