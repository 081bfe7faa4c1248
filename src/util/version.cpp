#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdint>

#include "util/version.hpp"
#include "util/args.hpp"
#include "util/format.hpp"

namespace
{
    struct ParsedVersion
    {
        std::vector<std::uint64_t> numbers;
        std::string suffix;
    };

    std::string trim(const std::string &text)
    {
        size_t begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
            return std::string();

        size_t end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    ParsedVersion parseVersion(const std::string &input)
    {
        ParsedVersion out;
        std::string v = trim(input);
        if (!v.empty() && (v[0] == 'v' || v[0] == 'V'))
            v = v.substr(1);

        // Build metadata never affects ordering
        size_t plus = v.find('+');
        if (plus != std::string::npos)
            v = v.substr(0, plus);

        size_t dash = v.find('-');
        if (dash != std::string::npos)
        {
            out.suffix = v.substr(dash + 1);
            v = v.substr(0, dash);
        }

        size_t start = 0;
        while (start <= v.size())
        {
            size_t dot = v.find('.', start);
            std::string component = v.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            out.numbers.push_back(parseUnsigned(component).value_or(0));
            if (dot == std::string::npos)
                break;
            start = dot + 1;
        }

        return out;
    }

    bool isNumeric(const std::string &identifier)
    {
        return !identifier.empty() &&
               std::all_of(identifier.begin(), identifier.end(),
                           [](unsigned char c)
                           { return std::isdigit(c) != 0; });
    }

    std::vector<std::string> splitIdentifiers(const std::string &suffix)
    {
        std::vector<std::string> identifiers;
        size_t start = 0;
        while (true)
        {
            size_t dot = suffix.find('.', start);
            identifiers.push_back(toLowerCase(suffix.substr(start, dot == std::string::npos ? std::string::npos : dot - start)));
            if (dot == std::string::npos)
                break;
            start = dot + 1;
        }
        return identifiers;
    }

    // Dot-separated identifiers: numbers compare numerically and rank below words;
    // a shorter list ranks below a longer one it prefixes
    int comparePrerelease(const std::string &a, const std::string &b)
    {
        const std::vector<std::string> ia = splitIdentifiers(a);
        const std::vector<std::string> ib = splitIdentifiers(b);

        for (size_t i = 0; i < ia.size() && i < ib.size(); ++i)
        {
            bool aNumeric = isNumeric(ia[i]);
            bool bNumeric = isNumeric(ib[i]);
            if (aNumeric && bNumeric)
            {
                std::uint64_t x = parseUnsigned(ia[i]).value_or(0);
                std::uint64_t y = parseUnsigned(ib[i]).value_or(0);
                if (x != y)
                    return x < y ? -1 : 1;
            }
            else if (aNumeric != bNumeric)
            {
                return aNumeric ? -1 : 1;
            }
            else if (ia[i] != ib[i])
            {
                return ia[i] < ib[i] ? -1 : 1;
            }
        }

        if (ia.size() == ib.size())
            return 0;
        return ia.size() < ib.size() ? -1 : 1;
    }
}

int compareVersions(const std::string &a, const std::string &b)
{
    const ParsedVersion va = parseVersion(a);
    const ParsedVersion vb = parseVersion(b);

    size_t count = std::max(va.numbers.size(), vb.numbers.size());
    for (size_t i = 0; i < count; ++i)
    {
        std::uint64_t x = i < va.numbers.size() ? va.numbers[i] : 0;
        std::uint64_t y = i < vb.numbers.size() ? vb.numbers[i] : 0;
        if (x != y)
            return x < y ? -1 : 1;
    }

    bool aPrerelease = !va.suffix.empty();
    bool bPrerelease = !vb.suffix.empty();
    if (aPrerelease && bPrerelease)
        return comparePrerelease(va.suffix, vb.suffix);
    if (aPrerelease == bPrerelease)
        return 0;

    return aPrerelease ? -1 : 1;
}
