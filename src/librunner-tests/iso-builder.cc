#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "lbrun/runner/iso-builder.hh"
#include "lbrun/util/file-system.hh"

#include "mock-sandbox.hh"

namespace lbrun {

using testing::_;
using testing::InSequence;
using testing::Return;
using testing::StrictMock;
using testing::Throw;

static const Strings installGit{"apt-get", "install", "-y", "git", "ca-certificates"};
static const Strings installLiveBuild{"apt-get", "install", "-y", "live-build"};

class IsoBuilderTest : public ::testing::Test
{
protected:
    AutoDelete scriptDir{createTempDir()};
    RunnerSettings settings;
    StrictMock<MockSandboxProvider> provider{settings};
    std::unique_ptr<CapturingLogger> capture = makeCapturingLogger();
    int releases = 0;

    void SetUp() override
    {
        settings.scriptDir = scriptDir.path().string();
    }

    JobContext context()
    {
        return JobContext{.jobId = "1234", .logger = *capture};
    }

    Path scriptPath() const
    {
        return scriptDir.path().string() + "/1234-commands.sh";
    }

    static JobDescriptor validJob()
    {
        return R"({
            "architecture": "amd64",
            "data": {
                "suite": "stable",
                "liveBuildGit": "https://salsa.debian.org/live-team/live-build-config.git"
            }
        })"_json;
    }

    void expectAcquire()
    {
        EXPECT_CALL(provider, acquire("stable-amd64", "1234"))
            .WillOnce([this](const std::string &, const std::string & jobId) -> std::unique_ptr<SandboxSession> {
                return std::make_unique<CountingSession>(jobId, releases);
            });
    }

    void configure(IsoBuilder & builder, JobDescriptor job = validJob())
    {
        ASSERT_TRUE(builder.configure(job, "/srv/workspace"));
    }
};

/* ----------------------------------------------------------------------------
 * configure
 * --------------------------------------------------------------------------*/

TEST_F(IsoBuilderTest, configureDerivesChrootName)
{
    IsoBuilder builder(provider, settings);

    ASSERT_FALSE(builder.isConfigured());
    ASSERT_TRUE(builder.configure(validJob(), "/srv/workspace"));

    ASSERT_TRUE(builder.isConfigured());
    ASSERT_EQ(builder.chrootName(), "stable-amd64");
    ASSERT_EQ(builder.workspace(), "/srv/workspace");
    ASSERT_EQ(builder.jobData(), validJob()["data"]);
}

TEST_F(IsoBuilderTest, configureRejectsIncompleteJobs)
{
    std::vector<std::string> invalidJobs = {
        R"({ "architecture": "amd64" })",
        R"({ "architecture": "amd64", "data": "stable" })",
        R"({ "architecture": "amd64", "data": { "liveBuildGit": "https://example.org/lb.git" } })",
        R"({ "architecture": "amd64", "data": { "suite": "", "liveBuildGit": "https://example.org/lb.git" } })",
        R"({ "data": { "suite": "stable", "liveBuildGit": "https://example.org/lb.git" } })",
        R"({ "architecture": "", "data": { "suite": "stable", "liveBuildGit": "https://example.org/lb.git" } })",
        R"({ "architecture": 64, "data": { "suite": "stable", "liveBuildGit": "https://example.org/lb.git" } })",
        R"({ "architecture": "amd64", "data": { "suite": "stable" } })",
        R"({ "architecture": "amd64", "data": { "suite": "stable", "liveBuildGit": "" } })",
        R"({ "architecture": "amd64", "data": { "suite": "stable", "liveBuildGit": "x", "flavor": 1 } })",
        R"([ "amd64" ])",
    };

    for (auto & text : invalidJobs) {
        IsoBuilder builder(provider, settings);
        EXPECT_FALSE(builder.configure(nlohmann::json::parse(text), "/srv/workspace")) << text;
        EXPECT_FALSE(builder.isConfigured()) << text;
        EXPECT_EQ(builder.chrootName(), "") << text;
        EXPECT_TRUE(builder.jobData().is_null()) << text;
        EXPECT_EQ(builder.workspace(), "") << text;
    }
}

TEST_F(IsoBuilderTest, configureAcceptsNullFlavor)
{
    auto job = validJob();
    job["data"]["flavor"] = nullptr;

    IsoBuilder builder(provider, settings);
    ASSERT_TRUE(builder.configure(job, "/srv/workspace"));
}

TEST_F(IsoBuilderTest, configureTwiceThrows)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    ASSERT_THROW(builder.configure(validJob(), "/srv/workspace"), Error);
}

TEST_F(IsoBuilderTest, failedConfigureCannotBeRetried)
{
    IsoBuilder builder(provider, settings);
    ASSERT_FALSE(builder.configure(R"({ "architecture": "amd64" })"_json, "/srv/workspace"));

    ASSERT_THROW(builder.configure(validJob(), "/srv/workspace"), Error);
    ASSERT_THROW(builder.run(context()), Error);
}

/* ----------------------------------------------------------------------------
 * run
 * --------------------------------------------------------------------------*/

TEST_F(IsoBuilderTest, runBeforeConfigureThrows)
{
    IsoBuilder builder(provider, settings);

    ASSERT_THROW(builder.run(context()), Error);
}

TEST_F(IsoBuilderTest, runRejectsUnsafeJobIds)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    auto ctx = context();
    ctx.jobId = "../1234";

    /* Nothing is acquired or written. */
    ASSERT_THROW(builder.run(ctx), UsageError);
    ASSERT_FALSE(pathExists(scriptDir.path().string() + "/../1234-commands.sh"));
}

TEST_F(IsoBuilderTest, runSucceeds)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    std::string copiedScript;
    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(true));
        EXPECT_CALL(provider, runLogged(_, _, installGit, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, runLogged(_, _, installLiveBuild, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, copyInto(_, scriptPath(), scriptPath()))
            .WillOnce([&](SandboxSession &, const Path & localPath, const Path &) {
                copiedScript = readFile(localPath);
            });
        EXPECT_CALL(provider, runLogged(_, _, Strings({"sh", "-e", scriptPath()}), "root")).WillOnce(Return(0));
    }

    ASSERT_TRUE(builder.run(context()));

    ASSERT_EQ(releases, 1);
    ASSERT_FALSE(pathExists(scriptPath()));

    auto expected = makeIsoBuildScript({
        .workDir = "/workspaces/1234",
        .resultsDir = "/workspaces/1234/result",
        .liveBuildGit = "https://salsa.debian.org/live-team/live-build-config.git",
    });
    ASSERT_EQ(copiedScript, expected.render());
}

TEST_F(IsoBuilderTest, gitInstallFailureStopsTheRun)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(true));
        EXPECT_CALL(provider, runLogged(_, _, installGit, "root")).WillOnce(Return(100 << 8));
    }

    ASSERT_FALSE(builder.run(context()));
    ASSERT_EQ(releases, 1);
    ASSERT_FALSE(pathExists(scriptPath()));
}

TEST_F(IsoBuilderTest, liveBuildInstallFailureStopsTheRun)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(true));
        EXPECT_CALL(provider, runLogged(_, _, installGit, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, runLogged(_, _, installLiveBuild, "root")).WillOnce(Return(1 << 8));
    }

    ASSERT_FALSE(builder.run(context()));
    ASSERT_EQ(releases, 1);
}

TEST_F(IsoBuilderTest, scriptFailureFailsTheRun)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(true));
        EXPECT_CALL(provider, runLogged(_, _, installGit, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, runLogged(_, _, installLiveBuild, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, copyInto(_, _, _));
        EXPECT_CALL(provider, runLogged(_, _, Strings({"sh", "-e", scriptPath()}), "root"))
            .WillOnce(Return(2 << 8));
    }

    ASSERT_FALSE(builder.run(context()));
    ASSERT_EQ(releases, 1);
    ASSERT_FALSE(pathExists(scriptPath()));
}

TEST_F(IsoBuilderTest, upgradeFailureIsNotFatal)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(false));
        EXPECT_CALL(provider, runLogged(_, _, installGit, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, runLogged(_, _, installLiveBuild, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, copyInto(_, _, _));
        EXPECT_CALL(provider, runLogged(_, _, Strings({"sh", "-e", scriptPath()}), "root")).WillOnce(Return(0));
    }

    ASSERT_TRUE(builder.run(context()));
    ASSERT_TRUE(capture->contains("upgrading sandbox 'lbrun-1234' failed"));
    ASSERT_EQ(releases, 1);
}

TEST_F(IsoBuilderTest, acquireFailurePropagates)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    EXPECT_CALL(provider, acquire("stable-amd64", "1234")).WillOnce(Throw(SandboxError("no such chroot")));

    ASSERT_THROW(builder.run(context()), SandboxError);
    ASSERT_EQ(releases, 0);
}

TEST_F(IsoBuilderTest, copyFailurePropagatesAndReleases)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(true));
        EXPECT_CALL(provider, runLogged(_, _, installGit, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, runLogged(_, _, installLiveBuild, "root")).WillOnce(Return(0));
        EXPECT_CALL(provider, copyInto(_, _, _)).WillOnce(Throw(SandboxError("disk full")));
    }

    ASSERT_THROW(builder.run(context()), SandboxError);
    ASSERT_EQ(releases, 1);
    ASSERT_FALSE(pathExists(scriptPath()));
}

TEST_F(IsoBuilderTest, runTwiceThrows)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(true));
        EXPECT_CALL(provider, runLogged(_, _, installGit, "root")).WillOnce(Return(1 << 8));
    }

    ASSERT_FALSE(builder.run(context()));
    ASSERT_THROW(builder.run(context()), Error);
    ASSERT_EQ(releases, 1);
}

TEST_F(IsoBuilderTest, cancelledJobStopsAtNextStep)
{
    IsoBuilder builder(provider, settings);
    configure(builder);

    auto ctx = context();
    ctx.interrupt->store(true);

    expectAcquire();

    ASSERT_FALSE(builder.run(ctx));
    ASSERT_EQ(releases, 1);
    ASSERT_TRUE(capture->contains("job '1234' was cancelled"));
}

TEST_F(IsoBuilderTest, usesConfiguredUserAndInstaller)
{
    settings.sandboxUser = "builder";
    settings.packageInstaller = "apt";
    settings.requireIsoArtifact = false;

    IsoBuilder builder(provider, settings);
    auto job = validJob();
    job["data"]["flavor"] = "minimal";
    configure(builder, job);

    std::string copiedScript;
    {
        InSequence seq;

        expectAcquire();
        EXPECT_CALL(provider, upgrade(_, _)).WillOnce(Return(true));
        EXPECT_CALL(provider, runLogged(_, _, Strings({"apt", "install", "-y", "git", "ca-certificates"}), "builder"))
            .WillOnce(Return(0));
        EXPECT_CALL(provider, runLogged(_, _, Strings({"apt", "install", "-y", "live-build"}), "builder"))
            .WillOnce(Return(0));
        EXPECT_CALL(provider, copyInto(_, _, _)).WillOnce([&](SandboxSession &, const Path & localPath, const Path &) {
            copiedScript = readFile(localPath);
        });
        EXPECT_CALL(provider, runLogged(_, _, Strings({"sh", "-e", scriptPath()}), "builder")).WillOnce(Return(0));
    }

    ASSERT_TRUE(builder.run(context()));

    ASSERT_NE(copiedScript.find("\nexport FLAVOR='minimal'\n"), std::string::npos);
    ASSERT_EQ(copiedScript.find("mv ./*.iso"), std::string::npos);
}

TEST_F(IsoBuilderTest, buildParamsAreDeterministic)
{
    IsoBuilder builder(provider, settings);
    auto job = validJob();
    job["data"]["flavor"] = "standard";
    configure(builder, job);

    int unused = 0;
    CountingSession session("1234", unused);

    auto params = builder.buildParams(session);
    ASSERT_EQ(params.workDir, "/workspaces/1234");
    ASSERT_EQ(params.resultsDir, "/workspaces/1234/result");
    ASSERT_EQ(params.flavor, "standard");
    ASSERT_TRUE(params.requireIsoArtifact);

    ASSERT_EQ(makeIsoBuildScript(params), makeIsoBuildScript(builder.buildParams(session)));
}

} // namespace lbrun
