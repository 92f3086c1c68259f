#pragma once
///@file

#include <string>
#include <string_view>

namespace lbrun {

/**
 * Whether stderr is a terminal that wants colors: `TERM` is set and
 * not "dumb", and neither `NO_COLOR` nor `NOCOLOR` is set.
 */
bool isTTY();

/**
 * Remove ANSI escape sequences and carriage returns from `s`.
 */
std::string stripANSIEscapes(std::string_view s);

} // namespace lbrun
