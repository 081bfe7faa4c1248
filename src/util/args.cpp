#include <sstream>
#include <vector>
#include <string>
#include <cctype>
#include <limits>

#include "util/args.hpp"
#include "util/format.hpp"

std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs)
{
    std::istringstream iss(command);
    std::vector<std::string> parts;
    std::string part;
    std::string currentArg;
    bool isQuoted = false; // Allows for parsing of quoted arguments (e.g. filenames with spaces)

    iss >> part; // Skip the command token itself (e.g. "add", "pause")

    while (iss)
    {
        char c = iss.get();
        if (iss.eof()) break;

        if (c == '"')
        {
            isQuoted = !isQuoted;
        }
        else if (c == ' ' && !isQuoted)
        {
            if (!currentArg.empty())
            {
                parts.push_back(currentArg);
                currentArg.clear();
                if (parts.size() >= maxArgs) return parts;
            }
        }
        else
        {
            currentArg += c;
        }
    }

    if (!currentArg.empty() && parts.size() < maxArgs)
    {
        parts.push_back(currentArg);
    }

    return parts;
}

std::optional<std::uint64_t> parseUnsigned(const std::string &text)
{
    if (text.empty())
        return std::nullopt;

    std::uint64_t value = 0;
    for (char c : text)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;

        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
            return std::nullopt;

        value = value * 10 + digit;
    }

    return value;
}

std::optional<bool> parseFlag(const std::string &text)
{
    std::string lowered = toLowerCase(text);

    if (lowered == "on" || lowered == "true" || lowered == "yes" || lowered == "1")
        return true;
    if (lowered == "off" || lowered == "false" || lowered == "no" || lowered == "0")
        return false;

    return std::nullopt;
}
