#pragma once
///@file

#include <atomic>
#include <functional>

#include "lbrun/util/util.hh"
#include "lbrun/util/types.hh"

namespace lbrun {

int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * @param loadConfig Whether to load configuration from `lbrun.conf` and
 * `LBRUN_CONFIG`. May be disabled for unit tests.
 */
void initLbrun(bool loadConfig = true);

/**
 * Parse the command line. Flags common to all programs (`--verbose`,
 * `--quiet`, `--option`, `--version`) are handled here; everything else
 * is passed to `parseArg`, which returns false for arguments it does not
 * recognise.
 */
void parseCmdLine(
    int argc, char ** argv, std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg);

void parseCmdLine(
    const std::string & programName,
    const Strings & args,
    std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> parseArg);

void printVersion(const std::string & programName);

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end);

template<class N>
N getIntArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    if (auto n = string2Int<N>(*i))
        return *n;
    throw UsageError("'%1%' requires an integer argument, got '%2%'", opt, *i);
}

/**
 * Set once SIGINT or SIGTERM has been received, after
 * `catchInterrupts()` installed the handlers.
 */
extern std::atomic<bool> interruptRequested;

void catchInterrupts();

} // namespace lbrun
