#pragma once
///@file

#include <boost/format.hpp>

#include <string>
#include <string_view>

#define ANSI_NORMAL "\e[0m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_WARNING "\e[35;1m"

namespace lbrun {

/**
 * A `boost::format` that tolerates a mismatch between the number of
 * placeholders and arguments.
 */
inline boost::format lenientFormat(const std::string & fs)
{
    boost::format f(fs);
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
    return f;
}

/**
 * Without arguments the string is returned as is, so text that may
 * contain `%` never goes through the formatter.
 */
inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

template<typename T, typename... Args>
std::string fmt(const std::string & fs, const T & arg, const Args &... args)
{
    auto f = lenientFormat(fs);
    f % arg;
    ((f % args), ...);
    return f.str();
}

/**
 * Interpolated into a `HintFmt` without highlighting.
 */
template<class T>
struct Uncolored
{
    const T & value;
};

template<class T>
struct Highlighted
{
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Highlighted<T> & h)
{
    return out << ANSI_WARNING << h.value << ANSI_NORMAL;
}

/**
 * A message whose interpolated arguments are highlighted, unless they
 * are wrapped in `Uncolored`.
 */
class HintFmt
{
    boost::format f;

    template<class T>
    void add(const T & value)
    {
        f % Highlighted<T>{value};
    }

    template<class T>
    void add(const Uncolored<T> & value)
    {
        f % value.value;
    }

public:
    explicit HintFmt(const std::string & literal)
        : f(lenientFormat("%s"))
    {
        f % literal;
    }

    template<typename T, typename... Args>
    HintFmt(const std::string & fs, const T & arg, const Args &... args)
        : f(lenientFormat(fs))
    {
        add(arg);
        (add(args), ...);
    }

    std::string str() const
    {
        return f.str();
    }
};

} // namespace lbrun
