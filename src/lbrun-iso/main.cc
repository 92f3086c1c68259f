#include "lbrun/main/shared.hh"
#include "lbrun/runner/iso-builder.hh"
#include "lbrun/runner/schroot.hh"
#include "lbrun/util/file-system.hh"
#include "lbrun/util/json-utils.hh"
#include "lbrun/util/strings.hh"

#include <ctime>

#include <unistd.h>

using namespace lbrun;

static void showHelp(const std::string & programName)
{
    logger->cout(
        "Usage: %1% --job FILE --workspace DIR [OPTIONS]\n"
        "\n"
        "Build a live-build ISO image for the job described in FILE.\n"
        "\n"
        "Options:\n"
        "  --job FILE             JSON job description\n"
        "  --workspace DIR        scratch directory for the job\n"
        "  --job-id ID            job identifier (default: the job's 'uuid')\n"
        "  --timeout SECONDS      limit for each command run in the sandbox\n"
        "  --option NAME VALUE    set a configuration setting\n"
        "  --show-config          print the effective configuration and exit\n"
        "  --json                 with --show-config, print it as JSON\n"
        "  -v, --verbose          increase verbosity\n"
        "  --quiet                decrease verbosity\n"
        "  --version              print the version and exit\n"
        "  --help                 print this help and exit",
        programName);
}

/**
 * The job's `uuid`, or a name unique on this host.
 */
static std::string defaultJobId(const JobDescriptor & job)
{
    if (job.is_object())
        if (auto * uuid = optionalValueAt(getObject(job), "uuid"); uuid && uuid->is_string())
            return getString(*uuid);
    return fmt("%d-%d", time(nullptr), getpid());
}

static void main_lbrun_iso(int argc, char ** argv)
{
    std::string programName = argc > 0 ? std::string(baseNameOf(argv[0])) : "lbrun-iso";

    initLbrun();

    std::optional<Path> jobFile;
    std::optional<Path> workspace;
    std::optional<std::string> jobId;
    std::optional<unsigned long> timeoutSeconds;
    bool showConfig = false;
    bool json = false;

    parseCmdLine(argc, argv, [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help") {
            showHelp(programName);
            throw Exit();
        } else if (*arg == "--job")
            jobFile = absPath(getArg(*arg, arg, end));
        else if (*arg == "--workspace")
            workspace = absPath(getArg(*arg, arg, end));
        else if (*arg == "--job-id")
            jobId = getArg(*arg, arg, end);
        else if (*arg == "--timeout")
            timeoutSeconds = getIntArg<unsigned long>(*arg, arg, end);
        else if (*arg == "--show-config")
            showConfig = true;
        else if (*arg == "--json")
            json = true;
        else
            return false;
        return true;
    });

    /* `--option print-build-logs` may have changed the setting. */
    logger = makeSimpleLogger(runnerSettings.printBuildLogs);

    if (showConfig) {
        if (json)
            logger->cout("%s", runnerSettings.toJSON().dump());
        else
            logger->cout("%s", trim(runnerSettings.toKeyValue()));
        return;
    }

    if (!jobFile)
        throw UsageError("no job description given, use '--job FILE'");
    if (!workspace)
        throw UsageError("no workspace given, use '--workspace DIR'");

    runnerSettings.warnUnknownSettings();

    std::optional<std::chrono::seconds> timeout;
    if (auto seconds = timeoutSeconds.value_or(runnerSettings.stepTimeout.get()); seconds != 0)
        timeout = std::chrono::seconds(seconds);

    auto job = parseJobDescriptor(readFile(*jobFile));

    createDirs(*workspace);

    SchrootSandboxProvider provider;
    IsoBuilder builder(provider);

    if (!builder.configure(job, *workspace)) {
        printError("job description '%s' is invalid", *jobFile);
        throw Exit(1);
    }

    if (!jobId)
        jobId = defaultJobId(job);
    checkJobId(*jobId);

    catchInterrupts();

    JobContext ctx{
        .jobId = *jobId,
        .logger = *logger,
        .timeout = timeout,
        .interrupt = std::shared_ptr<std::atomic<bool>>(std::shared_ptr<void>(), &interruptRequested),
    };

    if (!builder.run(ctx)) {
        printError("job '%s' failed", ctx.jobId);
        throw Exit(1);
    }
}

int main(int argc, char ** argv)
{
    return handleExceptions(argc > 0 ? argv[0] : "lbrun-iso", [&]() { main_lbrun_iso(argc, argv); });
}
