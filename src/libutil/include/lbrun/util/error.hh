#pragma once
///@file

#include "lbrun/util/fmt.hh"

#include <cerrno>
#include <cstring>
#include <exception>
#include <optional>
#include <string>

namespace lbrun {

enum Verbosity { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit };

/**
 * What the logger needs to report an error. Formatting into text
 * happens when it is printed.
 */
struct ErrorInfo
{
    Verbosity level = lvlError;
    HintFmt msg;

    /**
     * Exit status of the program if this error ends it.
     */
    unsigned int status = 1;
};

/**
 * `msg` with a colored "error: " (or "warning: " etc.) prefix.
 */
std::string renderErrorInfo(const ErrorInfo & ei);

class BaseError : public std::exception
{
protected:
    ErrorInfo err;

    mutable std::optional<std::string> what_;

public:
    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.msg = HintFmt(fs, args...)}
    {
    }

    explicit BaseError(ErrorInfo e)
        : err(std::move(e))
    {
    }

    /**
     * The message without the "error: " prefix.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const std::string & msg() const
    {
        if (!what_)
            what_ = renderErrorInfo(err);
        return *what_;
    }

    const char * what() const noexcept override
    {
        return msg().c_str();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    /**
     * Put context such as the file being written in front of the
     * message.
     */
    template<typename... Args>
    void addPrefix(const std::string & fs, const Args &... args)
    {
        err.msg = HintFmt("%s%s", Uncolored<std::string>{fmt(fs, args...)}, Uncolored<std::string>{message()});
        what_.reset();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * A failed system call. The message ends with `strerror(errNo)`.
 */
class SysError : public Error
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : Error(ErrorInfo{.msg = HintFmt("%s: %s", Uncolored<std::string>{fmt(args...)}, std::string(strerror(errNo)))})
        , errNo(errNo)
    {
    }

    /**
     * Uses the current `errno`, so construct it right after the call
     * that failed.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Thrown to end the program with `status` without printing anything.
 */
class Exit : public std::exception
{
public:
    int status = 0;

    Exit() = default;

    explicit Exit(int status)
        : status(status)
    {
    }
};

} // namespace lbrun
