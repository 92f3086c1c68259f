#include "lbrun/util/util.hh"
#include "lbrun/util/logging.hh"
#include "lbrun/util/terminal.hh"

#include <charconv>
#include <cstdlib>

namespace lbrun {

template<class N>
std::optional<N> string2Int(std::string_view s)
{
    N n;
    auto end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, n);
    if (s.empty() || ec != std::errc() || ptr != end)
        return std::nullopt;
    return n;
}

template std::optional<int> string2Int<int>(std::string_view s);
template std::optional<unsigned int> string2Int<unsigned int>(std::string_view s);
template std::optional<long> string2Int<long>(std::string_view s);
template std::optional<unsigned long> string2Int<unsigned long>(std::string_view s);

std::optional<std::string> getEnv(const std::string & key)
{
    if (auto value = std::getenv(key.c_str()))
        return value;
    return std::nullopt;
}

std::optional<std::string> getEnvNonEmpty(const std::string & key)
{
    auto value = getEnv(key);
    if (value && value->empty())
        return std::nullopt;
    return value;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        try {
            throw;
        } catch (Error & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.message());
        } catch (std::exception & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
        }
    } catch (...) {
        /* Logging itself failed; nothing left to report to. */
    }
}

} // namespace lbrun
