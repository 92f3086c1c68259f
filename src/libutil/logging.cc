#include "lbrun/util/logging.hh"
#include "lbrun/util/file-descriptor.hh"
#include "lbrun/util/terminal.hh"
#include "lbrun/util/util.hh"

#include <atomic>

#include <unistd.h>

namespace lbrun {

static thread_local ActivityId curActivity = 0;

ActivityId getCurActivity()
{
    return curActivity;
}

void setCurActivity(ActivityId activityId)
{
    curActivity = activityId;
}

Verbosity verbosity = lvlInfo;

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::writeToStdout(std::string_view s)
{
    writeFull(STDOUT_FILENO, std::string(s) + "\n");
}

namespace {

/* syslog priorities, understood by journald on stderr. */
char syslogPriority(Verbosity lvl)
{
    switch (lvl) {
    case lvlError:
        return '3';
    case lvlWarn:
        return '4';
    case lvlNotice:
    case lvlInfo:
        return '5';
    case lvlTalkative:
    case lvlChatty:
        return '6';
    default:
        return '7';
    }
}

class SimpleLogger : public Logger
{
    const bool systemd = getEnv("IN_SYSTEMD") == "1";
    const bool tty = isTTY();
    const bool printBuildLogs;

public:
    explicit SimpleLogger(bool printBuildLogs)
        : printBuildLogs(printBuildLogs)
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        std::string line;
        if (systemd)
            line = std::string("<") + syslogPriority(lvl) + ">";
        line += tty ? std::string(s) : stripANSIEscapes(s);
        line += '\n';

        /* Losing stderr must not stop cleanup code that logs. */
        try {
            writeFull(STDERR_FILENO, line);
        } catch (SysError &) {
        }
    }

    void startActivity(ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, ActivityId parent)
        override
    {
        if (!s.empty())
            log(lvl, s + "...");
    }

    void result(ActivityId act, ResultType type, std::string_view text) override
    {
        if (type == resBuildLogLine && printBuildLogs)
            log(lvlError, text);
        else if (type == resSetPhase)
            log(lvlTalkative, fmt("phase: %s", text));
    }
};

} // namespace

std::unique_ptr<Logger> makeSimpleLogger(bool printBuildLogs)
{
    return std::make_unique<SimpleLogger>(printBuildLogs);
}

void CapturingLogger::log(Verbosity lvl, std::string_view s)
{
    entries.push_back({lvl, stripANSIEscapes(s)});
}

void CapturingLogger::result(ActivityId act, ResultType type, std::string_view text)
{
    if (type == resBuildLogLine)
        logLines.emplace_back(text);
}

bool CapturingLogger::contains(std::string_view needle) const
{
    for (auto & e : entries)
        if (e.text.find(needle) != std::string::npos)
            return true;
    return false;
}

std::unique_ptr<CapturingLogger> makeCapturingLogger()
{
    return std::make_unique<CapturingLogger>();
}

static std::atomic<uint64_t> nextActivityId{0};

Activity::Activity(Logger & logger, Verbosity lvl, ActivityType type, const std::string & s, ActivityId parent)
    : logger(logger)
    , id(nextActivityId++ + (((uint64_t) getpid()) << 32))
{
    logger.startActivity(id, lvl, type, s, parent);
}

Activity::~Activity()
{
    try {
        logger.stopActivity(id);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

} // namespace lbrun
