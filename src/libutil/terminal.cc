#include "lbrun/util/terminal.hh"
#include "lbrun/util/util.hh"

#include <unistd.h>

namespace lbrun {

bool isTTY()
{
    static const bool tty = isatty(STDERR_FILENO) && getEnv("TERM").value_or("dumb") != "dumb" && !getEnv("NO_COLOR")
                            && !getEnv("NOCOLOR");
    return tty;
}

std::string stripANSIEscapes(std::string_view s)
{
    std::string res;
    res.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        char c = s[i++];
        if (c == '\r')
            continue;
        if (c != '\e') {
            res += c;
            continue;
        }
        if (i < s.size() && s[i] == '[') {
            /* CSI: parameter and intermediate bytes up to a final byte
               in 0x40-0x7e. */
            for (++i; i < s.size() && (s[i] < 0x40 || s[i] > 0x7e); ++i)
                ;
            if (i < s.size())
                ++i;
        } else if (i < s.size() && s[i] >= 0x40 && s[i] <= 0x5f)
            ++i;
    }

    return res;
}

} // namespace lbrun
