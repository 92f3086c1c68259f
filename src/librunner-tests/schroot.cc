#include <gtest/gtest.h>

#include <sys/wait.h>

#include "lbrun/runner/schroot.hh"
#include "lbrun/util/file-system.hh"
#include "lbrun/util/strings.hh"

namespace lbrun {

/* ----------------------------------------------------------------------------
 * Command lines
 * --------------------------------------------------------------------------*/

TEST(SchrootSandboxProvider, commandLines)
{
    RunnerSettings settings;
    SchrootSandboxProvider provider(settings);

    ASSERT_EQ(SchrootSandboxProvider::sessionNameFor("1234"), "lbrun-1234");
    ASSERT_EQ(
        provider.beginSessionArgs("lbrun-1234", "stable-amd64"),
        Strings({"-b", "-n", "lbrun-1234", "-c", "stable-amd64"}));
    ASSERT_EQ(provider.endSessionArgs("lbrun-1234"), Strings({"-e", "-c", "lbrun-1234"}));
    ASSERT_EQ(
        provider.runArgs("lbrun-1234", "root", {"apt-get", "install", "-y", "live-build"}),
        Strings({"-r", "-c", "lbrun-1234", "-u", "root", "-d", "/", "--", "apt-get", "install", "-y", "live-build"}));
    ASSERT_EQ(provider.locationArgs("lbrun-1234"), Strings({"--location", "-c", "session:lbrun-1234"}));
}

/* ----------------------------------------------------------------------------
 * Sessions, driven through a fake `schroot` that records its arguments
 * --------------------------------------------------------------------------*/

class SchrootTest : public ::testing::Test
{
protected:
    AutoDelete tmp{createTempDir()};
    Path dir = tmp.path().string();
    RunnerSettings settings;
    std::unique_ptr<CapturingLogger> capture = makeCapturingLogger();

    /**
     * Install a fake schroot. `failOn` is a case pattern matching the
     * arguments of the invocations that must fail; `location` is what
     * `--location` reports as the session root.
     */
    void fakeSchroot(const std::string & failOn = "", const std::string & location = "")
    {
        auto script = fmt(
            "#!/bin/sh\n"
            "echo \"$*\" >> %1%/calls\n"
            "case \"$*\" in\n"
            "  %2%) echo 'E: simulated failure'; exit 1 ;;\n"
            "  --location*) echo %3% ;;\n"
            "  -r*) shift 8; echo \"ran $*\" ;;\n"
            "esac\n",
            dir,
            failOn.empty() ? "__never__" : failOn,
            location.empty() ? dir + "/root" : location);
        writeFile(dir + "/schroot", script, 0755);
        settings.schrootProgram = dir + "/schroot";
    }

    std::vector<std::string> calls()
    {
        if (!pathExists(dir + "/calls"))
            return {};
        return tokenizeString<std::vector<std::string>>(readFile(dir + "/calls"), "\n");
    }

    JobContext context()
    {
        return JobContext{.jobId = "1234", .logger = *capture};
    }
};

TEST_F(SchrootTest, acquireBeginsAndReleaseEndsTheSession)
{
    fakeSchroot();
    SchrootSandboxProvider provider(settings);

    {
        auto session = provider.acquire("stable-amd64", "1234");
        ASSERT_EQ(session->name, "lbrun-1234");
        ASSERT_EQ(session->workDir, "/workspaces/1234");
        ASSERT_EQ(session->resultsDir, "/workspaces/1234/result");
        ASSERT_EQ(calls().size(), 2u);
    }

    ASSERT_EQ(
        calls(),
        std::vector<std::string>({
            "-b -n lbrun-1234 -c stable-amd64",
            "-r -c lbrun-1234 -u root -d / -- mkdir -p /workspaces/1234 /workspaces/1234/result",
            "-e -c lbrun-1234",
        }));
}

TEST_F(SchrootTest, acquireFailureThrows)
{
    fakeSchroot("-b*");
    SchrootSandboxProvider provider(settings);

    ASSERT_THROW(provider.acquire("stable-amd64", "1234"), SandboxError);
    ASSERT_EQ(calls().size(), 1u);
}

TEST_F(SchrootTest, failedSetupEndsTheSession)
{
    fakeSchroot("*mkdir*");
    SchrootSandboxProvider provider(settings);

    ASSERT_THROW(provider.acquire("stable-amd64", "1234"), SandboxError);
    ASSERT_EQ(calls().back(), "-e -c lbrun-1234");
}

TEST_F(SchrootTest, endSessionFailureThrows)
{
    fakeSchroot("-e*");
    SchrootSandboxProvider provider(settings);

    ASSERT_THROW(provider.endSession("lbrun-1234"), SandboxError);
}

TEST_F(SchrootTest, runLoggedStreamsOutput)
{
    fakeSchroot("*false*");
    settings.sandboxUser = "builder";
    SchrootSandboxProvider provider(settings);
    auto session = provider.acquire("stable-amd64", "1234");
    auto ctx = context();

    ASSERT_EQ(provider.runLogged(*session, ctx, {"apt-get", "install", "-y", "git"}, "builder"), 0);
    ASSERT_EQ(capture->logLines, std::vector<std::string>({"ran apt-get install -y git"}));

    auto status = provider.runLogged(*session, ctx, {"false"}, "builder");
    ASSERT_NE(status, 0);
    ASSERT_EQ(WEXITSTATUS(status), 1);
    ASSERT_TRUE(capture->contains("'false' failed with exit code 1"));
}

TEST_F(SchrootTest, upgradeRunsUpdateThenFullUpgrade)
{
    fakeSchroot();
    SchrootSandboxProvider provider(settings);
    auto session = provider.acquire("stable-amd64", "1234");

    ASSERT_TRUE(provider.upgrade(*session, context()));
    ASSERT_EQ(capture->logLines, std::vector<std::string>({"ran apt-get update", "ran apt-get full-upgrade -y"}));
}

TEST_F(SchrootTest, upgradeFailureIsReported)
{
    fakeSchroot("*update*");
    SchrootSandboxProvider provider(settings);
    auto session = provider.acquire("stable-amd64", "1234");

    ASSERT_FALSE(provider.upgrade(*session, context()));
}

TEST_F(SchrootTest, copyIntoUsesTheSessionLocation)
{
    fakeSchroot();
    SchrootSandboxProvider provider(settings);
    auto session = provider.acquire("stable-amd64", "1234");

    writeFile(dir + "/script.sh", "#!/bin/sh\n");
    provider.copyInto(*session, dir + "/script.sh", "/tmp/1234-commands.sh");

    ASSERT_EQ(readFile(dir + "/root/tmp/1234-commands.sh"), "#!/bin/sh\n");
}

TEST_F(SchrootTest, copyIntoSkipsFilesSharedWithTheSession)
{
    /* A session whose root is the host root sees the script at the
       same path. */
    fakeSchroot("", "/");
    SchrootSandboxProvider provider(settings);
    auto session = provider.acquire("stable-amd64", "1234");

    writeFile(dir + "/script.sh", "#!/bin/sh\n");
    provider.copyInto(*session, dir + "/script.sh", dir + "/script.sh");

    ASSERT_EQ(readFile(dir + "/script.sh"), "#!/bin/sh\n");
}

TEST_F(SchrootTest, copyIntoFailureThrows)
{
    fakeSchroot();
    SchrootSandboxProvider provider(settings);
    auto session = provider.acquire("stable-amd64", "1234");

    ASSERT_THROW(provider.copyInto(*session, dir + "/missing.sh", "/tmp/missing.sh"), SandboxError);
}

} // namespace lbrun
