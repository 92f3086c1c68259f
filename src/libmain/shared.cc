#include "lbrun/main/shared.hh"
#include "lbrun/runner/settings.hh"
#include "lbrun/util/file-system.hh"
#include "lbrun/util/logging.hh"
#include "lbrun/util/strings.hh"

#include <iostream>

#include <signal.h>

#ifndef LBRUN_VERSION
#  define LBRUN_VERSION "unknown"
#endif

namespace lbrun {

std::atomic<bool> interruptRequested{false};

static void interruptHandler(int signo)
{
    interruptRequested.store(true);
}

void catchInterrupts()
{
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;
    act.sa_handler = interruptHandler;
    if (sigaction(SIGINT, &act, 0))
        throw SysError("handling SIGINT");
    if (sigaction(SIGTERM, &act, 0))
        throw SysError("handling SIGTERM");
}

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

void initLbrun(bool loadConfig)
{
    initLibRunner(loadConfig);

    /* Reset SIGCHLD to its default. */
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;

    act.sa_handler = SIG_DFL;
    if (sigaction(SIGCHLD, &act, 0))
        throw SysError("resetting SIGCHLD");

    /* A closed log pipe must not kill us in the middle of a build. */
    act.sa_handler = SIG_IGN;
    if (sigaction(SIGPIPE, &act, 0))
        throw SysError("ignoring SIGPIPE");

    logger = makeSimpleLogger(runnerSettings.printBuildLogs);
}

void parseCmdLine(
    int argc, char ** argv, std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg)
{
    Strings args;
    for (int i = 1; i < argc; ++i)
        args.push_back(argv[i]);
    parseCmdLine(std::string(baseNameOf(argv[0])), args, parseArg);
}

void parseCmdLine(
    const std::string & programName,
    const Strings & _args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg)
{
    Strings args(_args);

    for (auto i = args.begin(); i != args.end(); ++i) {
        if (*i == "--verbose" || *i == "-v") {
            if (verbosity < lvlVomit)
                verbosity = (Verbosity) (verbosity + 1);
        } else if (*i == "--quiet") {
            if (verbosity > lvlError)
                verbosity = (Verbosity) (verbosity - 1);
        } else if (*i == "--option") {
            auto name = getArg(*i, i, args.end());
            auto value = getArg(*i, i, args.end());
            if (!runnerSettings.set(name, value))
                warn("unknown setting '%s'", name);
        } else if (*i == "--version")
            printVersion(programName);
        else if (!parseArg(i, args.end()))
            throw UsageError("unrecognised flag '%1%'", *i);
    }
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% (lbrun) %2%", programName, LBRUN_VERSION) << std::endl;
    if (verbosity > lvlInfo) {
        std::cout << "System configuration file: " << runnerSettings.lbrunConfDir + "/lbrun.conf" << "\n";
        std::cout << "Script directory: " << runnerSettings.scriptDir.get() << "\n";
        std::cout << "Sandbox workspace root: " << runnerSettings.sandboxWorkspaceRoot.get() << "\n";
    }
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

} // namespace lbrun
