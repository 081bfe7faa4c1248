#ifndef FORMAT_HPP
#define FORMAT_HPP

#include <string>
#include <cstdint>
#include <ctime>

std::string formatBytes(double bytes);
std::string formatTime(time_t time);
std::string formatDuration(std::uint64_t seconds);
std::string toLowerCase(const std::string &text);

#endif
