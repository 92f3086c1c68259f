#pragma once
///@file

#include <memory>

#include "lbrun/util/error.hh"
#include "lbrun/util/file-system.hh"
#include "lbrun/util/types.hh"
#include "lbrun/runner/command-script.hh"
#include "lbrun/runner/job.hh"

namespace lbrun {

class RunnerSettings;

/**
 * Raised when the sandbox itself cannot be set up, torn down or written
 * to. Unlike a failing command, this aborts the job.
 */
MakeError(SandboxError, Error);

/**
 * A disposable sandbox acquired for one job. Destroying the session
 * releases the sandbox; this happens exactly once.
 */
class SandboxSession
{
public:

    /**
     * Provider-specific identifier of the sandbox.
     */
    const std::string name;

    /**
     * The job's working directory inside the sandbox.
     */
    const Path workDir;

    /**
     * Where the job's artifacts must end up, inside the sandbox.
     */
    const Path resultsDir;

    SandboxSession(std::string name, Path workDir, Path resultsDir);

    SandboxSession(const SandboxSession &) = delete;
    SandboxSession & operator=(const SandboxSession &) = delete;

    virtual ~SandboxSession() = 0;
};

/**
 * The operations a job runner needs from a sandboxing backend.
 */
class SandboxProvider
{
protected:

    const RunnerSettings & settings;

public:

    SandboxProvider(const RunnerSettings & settings);

    virtual ~SandboxProvider() = default;

    /**
     * Create a fresh sandbox from the template `chrootName`, with a
     * working directory for `jobId`. Throws `SandboxError` if that is
     * not possible.
     */
    virtual std::unique_ptr<SandboxSession> acquire(const std::string & chrootName, const std::string & jobId) = 0;

    /**
     * Refresh the package index and upgrade the sandbox's packages.
     * Returns whether that succeeded.
     */
    virtual bool upgrade(SandboxSession & session, const JobContext & ctx) = 0;

    /**
     * Run `argv` inside the sandbox as `user`, reporting its output to
     * `ctx.logger`. Returns the wait status of the command; anything
     * but 0 means it failed.
     */
    virtual int
    runLogged(SandboxSession & session, const JobContext & ctx, const Strings & argv, const std::string & user) = 0;

    /**
     * Copy the host file `localPath` to `remotePath` inside the
     * sandbox.
     */
    virtual void copyInto(SandboxSession & session, const Path & localPath, const Path & remotePath) = 0;

    /**
     * Write `script` to an executable file on the host named after
     * `jobId`. The file is deleted when the returned object goes out of
     * scope.
     */
    virtual AutoDelete materializeScopedScript(const std::string & jobId, const CommandScript & script);
};

} // namespace lbrun
