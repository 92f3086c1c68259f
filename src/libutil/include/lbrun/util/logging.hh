#pragma once
///@file

#include "lbrun/util/error.hh"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lbrun {

enum ActivityType {
    actUnknown = 0,
    actJob = 100,
    actSandbox = 101,
    actRunCommand = 102,
};

enum ResultType {
    /**
     * One line of output of a command run in the sandbox.
     */
    resBuildLogLine = 101,

    /**
     * The job moved on to a new step.
     */
    resSetPhase = 104,
};

typedef uint64_t ActivityId;

class Logger
{
public:
    virtual ~Logger() = default;

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei)
    {
        log(ei.level, renderErrorInfo(ei));
    }

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg)
    {
        log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
    }

    virtual void startActivity(ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, ActivityId parent)
    {
    }

    virtual void stopActivity(ActivityId act) {}

    virtual void result(ActivityId act, ResultType type, std::string_view text) {}

    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    void cout(const std::string & fs, const Args &... args)
    {
        writeToStdout(fmt(fs, args...));
    }
};

ActivityId getCurActivity();
void setCurActivity(ActivityId activityId);

/**
 * A unit of work reported to a logger from construction until
 * destruction, e.g. a job or one command in the sandbox.
 */
struct Activity
{
    Logger & logger;
    const ActivityId id;

    Activity(
        Logger & logger,
        Verbosity lvl,
        ActivityType type,
        const std::string & s = "",
        ActivityId parent = getCurActivity());

    Activity(Logger & logger, ActivityType type, ActivityId parent = getCurActivity())
        : Activity(logger, lvlError, type, "", parent)
    {
    }

    Activity(const Activity &) = delete;

    ~Activity();

    void result(ResultType type, std::string_view text) const
    {
        logger.result(id, type, text);
    }
};

/**
 * Make `act` the parent of the activities started in this thread
 * while in scope.
 */
struct PushActivity
{
    const ActivityId prevAct;

    PushActivity(ActivityId act)
        : prevAct(getCurActivity())
    {
        setCurActivity(act);
    }

    ~PushActivity()
    {
        setCurActivity(prevAct);
    }
};

extern std::unique_ptr<Logger> logger;

/**
 * Log to stderr, with syslog priority prefixes when `IN_SYSTEMD=1`.
 * Build log lines are dropped unless `printBuildLogs` is set.
 */
std::unique_ptr<Logger> makeSimpleLogger(bool printBuildLogs = true);

/**
 * Keeps messages and build log lines in memory, in order, with colors
 * stripped.
 */
class CapturingLogger : public Logger
{
public:
    struct Entry
    {
        Verbosity level;
        std::string text;
    };

    std::vector<Entry> entries;
    std::vector<std::string> logLines;

    void log(Verbosity lvl, std::string_view s) override;

    void result(ActivityId act, ResultType type, std::string_view text) override;

    bool contains(std::string_view needle) const;
};

std::unique_ptr<CapturingLogger> makeCapturingLogger();

/**
 * Messages above this level are dropped.
 */
extern Verbosity verbosity;

#define logError(errorInfo)                       \
    do {                                          \
        if (lvlError <= lbrun::verbosity)         \
            logger->logEI(lvlError, (errorInfo)); \
    } while (0)

/**
 * The arguments are only evaluated if the message is printed.
 */
#define printMsgUsing(loggerParam, level, args...) \
    do {                                           \
        auto lvl_ = (level);                       \
        if (lvl_ <= lbrun::verbosity)              \
            (loggerParam)->log(lvl_, fmt(args));   \
    } while (0)

#define printMsg(level, args...) printMsgUsing(logger, level, args)
#define printError(args...) printMsg(lvlError, args)
#define debug(args...) printMsg(lvlDebug, args)

template<typename... Args>
void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

} // namespace lbrun
