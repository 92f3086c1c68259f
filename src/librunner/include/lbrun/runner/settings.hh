#pragma once
///@file

#include "lbrun/util/configuration.hh"
#include "lbrun/util/types.hh"

namespace lbrun {

class RunnerSettings : public Config
{
public:

    RunnerSettings();

    /**
     * The directory where the runner's configuration file lives.
     */
    Path lbrunConfDir;

    Setting<std::string> schrootProgram{
        this, "schroot", "schroot-program", "The `schroot` executable used to manage sandbox sessions."};

    PathSetting sandboxWorkspaceRoot{
        this,
        "/workspaces",
        "sandbox-workspace-root",
        R"(
          Directory inside the sandbox under which each job gets its own
          working directory, named after the job identifier.
        )"};

    Setting<std::string> sandboxUser{
        this,
        "root",
        "sandbox-user",
        "The privileged user that installs packages and runs the build script inside the sandbox."};

    Setting<std::string> packageInstaller{
        this, "apt-get", "package-installer", "The package manager used to install build dependencies."};

    PathSetting scriptDir;

    Setting<bool> requireIsoArtifact{
        this,
        true,
        "require-iso-artifact",
        R"(
          If set, the build script fails when the build produced no `.iso`
          image. Otherwise a missing image is tolerated like the other
          artifact classes.
        )"};

    Setting<unsigned long> stepTimeout{
        this,
        0,
        "step-timeout",
        R"(
          Maximum number of seconds a single sandbox command may run before
          it is killed. `0` means no limit.
        )"};

    Setting<bool> printBuildLogs{
        this, true, "print-build-logs", "Whether to print the output of sandbox commands to the log."};
};

extern RunnerSettings runnerSettings;

/**
 * Apply `$LBRUN_CONF_DIR/lbrun.conf` (if it exists) and then the
 * contents of `LBRUN_CONFIG` to `config`.
 */
void loadConfFile(Config & config);

/**
 * Initialise the runner library, loading the configuration unless
 * `loadConfig` is false.
 */
void initLibRunner(bool loadConfig = true);

} // namespace lbrun
