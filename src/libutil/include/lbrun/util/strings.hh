#pragma once
///@file

#include "lbrun/util/types.hh"

#include <string>
#include <string_view>
#include <vector>

namespace lbrun {

/**
 * Split `s` at any of `separators`, dropping empty tokens.
 */
template<class C>
C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

extern template Strings tokenizeString(std::string_view s, std::string_view separators);
extern template std::vector<std::string> tokenizeString(std::string_view s, std::string_view separators);

template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss)
{
    std::string res;
    bool first = true;
    for (auto & s : ss) {
        if (!first)
            res.append(sep);
        res.append(s);
        first = false;
    }
    return res;
}

template<class C, class F>
std::string concatMapStringsSep(std::string_view sep, const C & ss, F fn)
{
    std::vector<std::string> mapped;
    for (auto & s : ss)
        mapped.push_back(fn(s));
    return concatStringsSep(sep, mapped);
}

std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * Quote `s` as a single shell word, e.g. `it's` becomes `'it'\''s'`.
 */
std::string shellEscape(std::string_view s);

/**
 * Remove the indentation that all non-empty lines of `s` share, so
 * that indented raw string literals read naturally. The result ends
 * in a newline.
 */
std::string stripIndentation(std::string_view s);

} // namespace lbrun
