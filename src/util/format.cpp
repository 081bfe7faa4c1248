#include <sstream>
#include <stdio.h>
#include <time.h>
#include <iomanip>
#include <algorithm>
#include <cctype>

#include "util/format.hpp"

std::string formatBytes(double bytes) {
    const double KB = 1024.0;
    const double MB = KB * 1024.0;
    const double GB = MB * 1024.0;

    std::ostringstream oss;
    oss << std::fixed;

    if (bytes < KB) {
        oss << std::setprecision(0) << bytes << " B";
    } else if (bytes < MB) {
        oss << std::setprecision(0) << (bytes / KB) << " KB";
    } else if (bytes < GB) {
        oss << std::setprecision(1) << (bytes / MB) << " MB";
    } else {
        oss << std::setprecision(2) << (bytes / GB) << " GB";
    }

    return oss.str();
}

std::string formatTime(time_t time) {
    char buffer[20];
    struct tm timeinfo{};
    localtime_r(&time, &timeinfo);
    strftime(buffer, sizeof(buffer), "%H:%M:%S %d/%m/%y", &timeinfo);

    return std::string(buffer);
}

// <h>h <m>m <s>s, dropping leading zero units
std::string formatDuration(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m " << secs << "s";
    } else if (minutes > 0) {
        oss << minutes << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }

    return oss.str();
}

std::string toLowerCase(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}
