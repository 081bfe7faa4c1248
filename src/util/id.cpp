#include <random>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <cstdint>

#include "util/id.hpp"

std::string generateId(const std::string &prefix)
{
    static std::mutex generatorMutex;
    static std::mt19937_64 generator{std::random_device{}()};

    std::uint64_t value;
    {
        std::lock_guard<std::mutex> lock(generatorMutex);
        value = generator();
    }

    std::ostringstream ss;
    ss << prefix << std::hex << std::setfill('0') << std::setw(16) << value;
    return ss.str();
}
