#include "lbrun/runner/sandbox.hh"
#include "lbrun/runner/settings.hh"
#include "lbrun/util/logging.hh"

namespace lbrun {

SandboxSession::SandboxSession(std::string name, Path workDir, Path resultsDir)
    : name(std::move(name))
    , workDir(std::move(workDir))
    , resultsDir(std::move(resultsDir))
{
}

SandboxSession::~SandboxSession() {}

SandboxProvider::SandboxProvider(const RunnerSettings & settings)
    : settings(settings)
{
}

AutoDelete SandboxProvider::materializeScopedScript(const std::string & jobId, const CommandScript & script)
{
    createDirs(settings.scriptDir);
    auto path = fmt("%s/%s-commands.sh", settings.scriptDir.get(), jobId);
    AutoDelete scriptFile(path, false);
    writeFile(path, script.render(), 0755);
    debug("wrote build script '%s'", path);
    return scriptFile;
}

} // namespace lbrun
