#include "fetchcache/util/util.hh"

#include <array>
#include <cctype>

namespace fetchcache {

std::string chomp(std::string_view s)
{
    size_t i = s.find_last_not_of(" \n\r\t");
    return i == s.npos ? "" : std::string(s, 0, i + 1);
}

std::string trim(std::string_view s, std::string_view whitespace)
{
    auto i = s.find_first_not_of(whitespace);
    if (i == s.npos)
        return "";
    auto j = s.find_last_not_of(whitespace);
    return std::string(s, i, j == s.npos ? j : j - i + 1);
}

std::string renderSize(uint64_t value)
{
    static const std::array<char, 9> prefixes{{'K', 'M', 'G', 'T', 'P', 'E', 'Z', 'Y'}};
    size_t power = 0;
    double res = value;
    while (res > 1024 && power < prefixes.size()) {
        ++power;
        res /= 1024;
    }
    if (power == 0)
        return fmt("%d B", value);
    return fmt("%.1f %ciB", res, prefixes.at(power - 1));
}

bool hasPrefix(std::string_view s, std::string_view prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool hasSuffix(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string toLower(std::string s)
{
    for (auto & c : s)
        c = std::tolower((unsigned char) c);
    return s;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        throw;
    } catch (std::exception & e) {
        printMsg(lvl, "error (ignored): %1%", e.what());
    }
}

} // namespace fetchcache
