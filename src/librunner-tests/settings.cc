#include <gtest/gtest.h>

#include <cstdlib>

#include "lbrun/runner/settings.hh"
#include "lbrun/util/file-system.hh"

namespace lbrun {

TEST(RunnerSettings, defaults)
{
    RunnerSettings settings;

    ASSERT_EQ(settings.schrootProgram.get(), "schroot");
    ASSERT_EQ(settings.sandboxWorkspaceRoot.get(), "/workspaces");
    ASSERT_EQ(settings.sandboxUser.get(), "root");
    ASSERT_EQ(settings.packageInstaller.get(), "apt-get");
    ASSERT_EQ(settings.scriptDir.get(), canonPath(defaultTempDir()));
    ASSERT_TRUE(settings.requireIsoArtifact.get());
    ASSERT_EQ(settings.stepTimeout.get(), 0u);
    ASSERT_TRUE(settings.printBuildLogs.get());
}

TEST(RunnerSettings, setByName)
{
    RunnerSettings settings;

    ASSERT_TRUE(settings.set("sandbox-user", "builder"));
    ASSERT_TRUE(settings.set("require-iso-artifact", "false"));
    ASSERT_TRUE(settings.set("step-timeout", "3600"));
    ASSERT_TRUE(settings.set("sandbox-workspace-root", "/srv//jobs/"));
    ASSERT_FALSE(settings.set("no-such-setting", "1"));

    ASSERT_EQ(settings.sandboxUser.get(), "builder");
    ASSERT_FALSE(settings.requireIsoArtifact.get());
    ASSERT_EQ(settings.stepTimeout.get(), 3600u);
    ASSERT_EQ(settings.sandboxWorkspaceRoot.get(), "/srv/jobs");
}

TEST(RunnerSettings, rejectsBadValues)
{
    RunnerSettings settings;

    ASSERT_THROW(settings.set("step-timeout", "soon"), UsageError);
    ASSERT_THROW(settings.set("require-iso-artifact", "maybe"), UsageError);
    ASSERT_THROW(settings.set("script-dir", ""), UsageError);
}

TEST(RunnerSettings, loadConfFileReadsEnvironment)
{
    RunnerSettings settings;

    setenv("LBRUN_CONFIG", "package-installer = apt\nstep-timeout = 60\n", 1);
    loadConfFile(settings);
    unsetenv("LBRUN_CONFIG");

    ASSERT_EQ(settings.packageInstaller.get(), "apt");
    ASSERT_EQ(settings.stepTimeout.get(), 60u);
}

} // namespace lbrun
