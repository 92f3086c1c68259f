#pragma once
///@file

#include <list>
#include <map>
#include <string>
#include <string_view>

namespace lbrun {

typedef std::list<std::string> Strings;

/**
 * Transparent comparison, so lookups by `std::string_view` do not
 * allocate.
 */
typedef std::map<std::string, std::string, std::less<>> StringMap;

typedef std::string Path;
typedef std::string_view PathView;

} // namespace lbrun
