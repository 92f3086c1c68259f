#include "lbrun/util/strings.hh"

#include <algorithm>

namespace lbrun {

template<class C>
C tokenizeString(std::string_view s, std::string_view separators)
{
    C res;
    for (auto start = s.find_first_not_of(separators); start != s.npos;) {
        auto end = std::min(s.find_first_of(separators, start), s.size());
        res.emplace_back(s.substr(start, end - start));
        start = s.find_first_not_of(separators, end);
    }
    return res;
}

template Strings tokenizeString(std::string_view s, std::string_view separators);
template std::vector<std::string> tokenizeString(std::string_view s, std::string_view separators);

std::string trim(std::string_view s, std::string_view whitespace)
{
    auto first = s.find_first_not_of(whitespace);
    if (first == s.npos)
        return "";
    return std::string(s.substr(first, s.find_last_not_of(whitespace) - first + 1));
}

std::string shellEscape(std::string_view s)
{
    std::string res = "'";
    for (auto c : s) {
        if (c == '\'')
            res += "'\\''";
        else
            res += c;
    }
    res += '\'';
    return res;
}

std::string stripIndentation(std::string_view s)
{
    std::vector<std::string_view> lines;
    for (size_t pos = 0; pos < s.size();) {
        auto eol = std::min(s.find('\n', pos), s.size());
        lines.push_back(s.substr(pos, eol - pos));
        pos = eol + 1;
    }

    auto indent = std::string_view::npos;
    for (auto line : lines) {
        auto first = line.find_first_not_of(' ');
        if (first != line.npos)
            indent = std::min(indent, first);
    }

    std::string res;
    for (auto line : lines) {
        if (line.size() > indent)
            res.append(line.substr(indent));
        res += '\n';
    }
    return res;
}

} // namespace lbrun
