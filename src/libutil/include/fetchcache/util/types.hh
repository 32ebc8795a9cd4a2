#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <map>
#include <vector>

namespace fetchcache {

typedef std::list<std::string> Strings;

/**
 * Alias to ordered std::string -> std::string map container with transparent comparator.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

/**
 * Alias to ordered set container with transparent comparator.
 */
using StringSet = std::set<std::string, std::less<>>;

typedef std::vector<std::pair<std::string, std::string>> Headers;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;

} // namespace fetchcache
