#pragma once
///@file

#include "lbrun/runner/command-script.hh"
#include "lbrun/runner/job.hh"
#include "lbrun/runner/sandbox.hh"
#include "lbrun/runner/settings.hh"

namespace lbrun {

/**
 * Builds a live-build ISO image for one job inside a sandbox.
 *
 * An instance serves exactly one job: `configure()` it once, and if that
 * succeeded, `run()` it once.
 */
class IsoBuilder
{
    enum class State {
        Unconfigured,
        Configured,
        /**
         * `configure()` rejected the job; the instance is unusable.
         */
        Invalid,
        Ran,
    };

    SandboxProvider & provider;
    const RunnerSettings & settings;

    State state = State::Unconfigured;

    Path _workspace;
    nlohmann::json _jobData;
    std::string _chrootName;

public:

    IsoBuilder(SandboxProvider & provider, const RunnerSettings & settings = runnerSettings);

    /**
     * Validate `job` and remember what `run()` needs from it. Returns
     * false, leaving the instance unusable, if `job` lacks `data`,
     * `architecture`, `data.suite` or `data.liveBuildGit`, or if any of
     * these has the wrong type. Throws `Error` if called twice.
     */
    bool configure(const JobDescriptor & job, const Path & workspace);

    /**
     * Build the image. Returns false if a package installation or the
     * build script failed, or if the job was cancelled through `ctx`.
     * Failures of the sandbox itself propagate as `SandboxError`.
     */
    bool run(const JobContext & ctx);

    bool isConfigured() const
    {
        return state == State::Configured || state == State::Ran;
    }

    /**
     * `<suite>-<architecture>`, the name of the chroot the sandbox is
     * created from.
     */
    const std::string & chrootName() const
    {
        return _chrootName;
    }

    const nlohmann::json & jobData() const
    {
        return _jobData;
    }

    const Path & workspace() const
    {
        return _workspace;
    }

    /**
     * The parameters of the build script for `session`.
     */
    IsoBuildParams buildParams(const SandboxSession & session) const;
};

} // namespace lbrun
