#include <algorithm>

#include "ui/Screen.hpp"
#include "util/args.hpp"

std::string Screen::resolveId(const std::string &argument, const std::vector<std::string> &ids)
{
    if (std::find(ids.begin(), ids.end(), argument) != ids.end())
        return argument;

    std::optional<std::uint64_t> index = parseUnsigned(argument);
    if (index && *index >= 1 && *index <= ids.size())
        return ids[*index - 1];

    throw ManagerError(ErrorKind::NOT_FOUND, "No entry matches '" + argument + "'");
}
