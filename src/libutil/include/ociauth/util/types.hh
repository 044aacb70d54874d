#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <map>
#include <vector>

namespace ociauth {

typedef std::list<std::string> Strings;

/**
 * Alias to ordered std::string -> std::string map container with transparent comparator.
 *
 * Transparent comparators get rid of creation of unnecessary
 * temporary variables when looking up keys by `std::string_view`
 * or C-style `const char *` strings.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

/**
 * Alias to ordered set container with transparent comparator.
 */
using StringSet = std::set<std::string, std::less<>>;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;

} // namespace ociauth
