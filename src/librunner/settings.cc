#include "lbrun/runner/settings.hh"
#include "lbrun/util/file-system.hh"
#include "lbrun/util/util.hh"

namespace lbrun {

RunnerSettings runnerSettings;

RunnerSettings::RunnerSettings()
    : lbrunConfDir(canonPath(getEnvNonEmpty("LBRUN_CONF_DIR").value_or("/etc/lbrun")))
    , scriptDir(
          this,
          canonPath(defaultTempDir()),
          "script-dir",
          "Directory on the host where build scripts are written before they are copied into the sandbox.")
{
}

void loadConfFile(Config & config)
{
    auto confFile = runnerSettings.lbrunConfDir + "/lbrun.conf";
    if (pathExists(confFile))
        config.applyConfig(readFile(confFile), confFile);

    if (auto confEnv = getEnv("LBRUN_CONFIG"))
        config.applyConfig(*confEnv, "LBRUN_CONFIG");
}

static bool initLibRunnerDone = false;

void initLibRunner(bool loadConfig)
{
    if (initLibRunnerDone)
        return;

    if (loadConfig)
        loadConfFile(runnerSettings);

    initLibRunnerDone = true;
}

} // namespace lbrun
