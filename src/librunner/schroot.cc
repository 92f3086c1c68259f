#include "lbrun/runner/schroot.hh"
#include "lbrun/util/processes.hh"
#include "lbrun/util/strings.hh"
#include "lbrun/util/util.hh"

namespace lbrun {

namespace {

struct SchrootSession : SandboxSession
{
    SchrootSandboxProvider & provider;

    SchrootSession(SchrootSandboxProvider & provider, std::string name, Path workDir, Path resultsDir)
        : SandboxSession(std::move(name), std::move(workDir), std::move(resultsDir))
        , provider(provider)
    {
    }

    ~SchrootSession()
    {
        try {
            provider.endSession(name);
        } catch (...) {
            ignoreExceptionInDestructor();
        }
    }
};

} // namespace

SchrootSandboxProvider::SchrootSandboxProvider(const RunnerSettings & settings)
    : SandboxProvider(settings)
{
}

std::string SchrootSandboxProvider::sessionNameFor(const std::string & jobId)
{
    return "lbrun-" + jobId;
}

Strings SchrootSandboxProvider::beginSessionArgs(const std::string & sessionName, const std::string & chrootName) const
{
    return {"-b", "-n", sessionName, "-c", chrootName};
}

Strings SchrootSandboxProvider::endSessionArgs(const std::string & sessionName) const
{
    return {"-e", "-c", sessionName};
}

Strings
SchrootSandboxProvider::runArgs(const std::string & sessionName, const std::string & user, const Strings & argv) const
{
    Strings args{"-r", "-c", sessionName, "-u", user, "-d", "/", "--"};
    args.insert(args.end(), argv.begin(), argv.end());
    return args;
}

Strings SchrootSandboxProvider::locationArgs(const std::string & sessionName) const
{
    return {"--location", "-c", "session:" + sessionName};
}

std::unique_ptr<SandboxSession>
SchrootSandboxProvider::acquire(const std::string & chrootName, const std::string & jobId)
{
    auto sessionName = sessionNameFor(jobId);
    Activity act(
        *logger, lvlTalkative, actSandbox, fmt("beginning schroot session '%s' of '%s'", sessionName, chrootName));

    auto [status, output] = runProgram(RunOptions{
        .program = settings.schrootProgram,
        .args = beginSessionArgs(sessionName, chrootName),
        .mergeStderrToStdout = true,
    });
    if (!statusOk(status))
        throw SandboxError(
            "cannot begin a session of chroot '%s': schroot %s: %s", chrootName, statusToString(status), trim(output));

    auto workDir = fmt("%s/%s", settings.sandboxWorkspaceRoot.get(), jobId);
    auto session = std::make_unique<SchrootSession>(*this, sessionName, workDir, workDir + "/result");

    auto [mkdirStatus, mkdirOutput] = runProgram(RunOptions{
        .program = settings.schrootProgram,
        .args = runArgs(sessionName, settings.sandboxUser, {"mkdir", "-p", session->workDir, session->resultsDir}),
        .mergeStderrToStdout = true,
    });
    if (!statusOk(mkdirStatus))
        throw SandboxError(
            "cannot create the job directory '%s' in session '%s': %s",
            session->workDir,
            sessionName,
            trim(mkdirOutput));

    debug("began schroot session '%s' for job '%s'", sessionName, jobId);
    return session;
}

void SchrootSandboxProvider::endSession(const std::string & sessionName)
{
    auto [status, output] = runProgram(RunOptions{
        .program = settings.schrootProgram,
        .args = endSessionArgs(sessionName),
        .mergeStderrToStdout = true,
    });
    if (!statusOk(status))
        throw SandboxError(
            "cannot end schroot session '%s': %s: %s", sessionName, statusToString(status), trim(output));
    debug("ended schroot session '%s'", sessionName);
}

bool SchrootSandboxProvider::upgrade(SandboxSession & session, const JobContext & ctx)
{
    const std::string & installer = settings.packageInstaller;
    return runLogged(session, ctx, {installer, "update"}, settings.sandboxUser) == 0
           && runLogged(session, ctx, {installer, "full-upgrade", "-y"}, settings.sandboxUser) == 0;
}

int SchrootSandboxProvider::runLogged(
    SandboxSession & session, const JobContext & ctx, const Strings & argv, const std::string & user)
{
    auto command = concatStringsSep(" ", argv);
    Activity act(ctx.logger, lvlInfo, actRunCommand, fmt("running '%s' in '%s'", command, session.name));

    auto res = runProgram2(RunOptions{
        .program = settings.schrootProgram,
        .args = runArgs(session.name, user, argv),
        .mergeStderrToStdout = true,
        .timeout = ctx.timeout,
        .interrupt = ctx.interrupt.get(),
        .lineCallback = [&](std::string_view line) { act.result(resBuildLogLine, line); },
    });

    if (res.timedOut)
        printMsgUsing((&ctx.logger), lvlError, "'%s' timed out after %d seconds", command, ctx.timeout->count());
    else if (res.interrupted)
        printMsgUsing((&ctx.logger), lvlError, "'%s' was interrupted", command);
    else if (!statusOk(res.status))
        printMsgUsing((&ctx.logger), lvlError, "'%s' %s", command, statusToString(res.status));

    return res.status;
}

void SchrootSandboxProvider::copyInto(SandboxSession & session, const Path & localPath, const Path & remotePath)
{
    auto [status, output] = runProgram(RunOptions{
        .program = settings.schrootProgram,
        .args = locationArgs(session.name),
    });
    if (!statusOk(status))
        throw SandboxError("cannot locate schroot session '%s': %s", session.name, statusToString(status));

    auto target = canonPath(trim(output) + "/" + remotePath);

    /* Directories such as /tmp may be bind-mounted into the session, in
       which case the file is already there. */
    std::error_code ec;
    if (std::filesystem::equivalent(localPath, target, ec)) {
        debug("'%s' is already visible in session '%s'", localPath, session.name);
        return;
    }

    try {
        createDirs(dirOf(target));
        copyFile(localPath, target);
    } catch (SysError & e) {
        throw SandboxError("cannot copy '%s' into session '%s': %s", localPath, session.name, e.message());
    }
}

} // namespace lbrun
