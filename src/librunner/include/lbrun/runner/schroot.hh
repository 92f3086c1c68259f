#pragma once
///@file

#include "lbrun/runner/sandbox.hh"
#include "lbrun/runner/settings.hh"

namespace lbrun {

/**
 * Sandboxes are `schroot` sessions cloned from a source chroot named
 * `<suite>-<architecture>`. A session lives from `acquire` until the
 * returned `SandboxSession` is destroyed.
 */
class SchrootSandboxProvider : public SandboxProvider
{
public:

    SchrootSandboxProvider(const RunnerSettings & settings = runnerSettings);

    std::unique_ptr<SandboxSession> acquire(const std::string & chrootName, const std::string & jobId) override;

    bool upgrade(SandboxSession & session, const JobContext & ctx) override;

    int runLogged(
        SandboxSession & session, const JobContext & ctx, const Strings & argv, const std::string & user) override;

    void copyInto(SandboxSession & session, const Path & localPath, const Path & remotePath) override;

    /**
     * End the session named `sessionName`. Throws `SandboxError` on
     * failure.
     */
    void endSession(const std::string & sessionName);

    static std::string sessionNameFor(const std::string & jobId);

    Strings beginSessionArgs(const std::string & sessionName, const std::string & chrootName) const;

    Strings endSessionArgs(const std::string & sessionName) const;

    Strings runArgs(const std::string & sessionName, const std::string & user, const Strings & argv) const;

    Strings locationArgs(const std::string & sessionName) const;
};

} // namespace lbrun
