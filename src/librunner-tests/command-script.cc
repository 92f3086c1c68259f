#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "lbrun/runner/command-script.hh"
#include "lbrun/util/file-system.hh"
#include "lbrun/util/processes.hh"
#include "lbrun/util/strings.hh"

namespace lbrun {

static IsoBuildParams params(std::string flavor = "", bool requireIsoArtifact = true)
{
    return IsoBuildParams{
        .workDir = "/workspaces/1234",
        .resultsDir = "/workspaces/1234/result",
        .liveBuildGit = "https://salsa.debian.org/live-team/live-build-config.git",
        .flavor = std::move(flavor),
        .requireIsoArtifact = requireIsoArtifact,
    };
}

TEST(CommandScript, renderAddsInterpreterLine)
{
    CommandScript script;
    script.add("true").add("echo done");

    ASSERT_EQ(script.render(), "#!/bin/sh\ntrue\necho done\n");
}

TEST(makeIsoBuildScript, withoutFlavor)
{
    std::vector<std::string> expected = {
        "export DEBIAN_FRONTEND=noninteractive",
        "cd /workspaces/1234",
        "git clone --depth=2 'https://salsa.debian.org/live-team/live-build-config.git' /workspaces/1234/lb",
        "cd ./lb",
        "lb config",
        "lb build",
        R"(find . -maxdepth 1 -type f \( -name '*.iso' -o -name '*.contents' -o -name '*.zsync' -o -name '*.packages' \) -printf '%P\0' | sort -z | xargs -0 -r b2sum -l 256 > checksums.b2sum)",
        R"(find . -maxdepth 1 -type f \( -name '*.iso' -o -name '*.contents' -o -name '*.zsync' -o -name '*.packages' \) -printf '%P\0' | sort -z | xargs -0 -r sha256sum > checksums.sha256sum)",
        "mv ./*.iso /workspaces/1234/result/",
        R"(find . -maxdepth 1 -type f \( -name '*.zsync' \) -exec mv -f -t /workspaces/1234/result/ {} +)",
        R"(find . -maxdepth 1 -type f \( -name '*.contents' \) -exec mv -f -t /workspaces/1234/result/ {} +)",
        R"(find . -maxdepth 1 -type f \( -name '*.files' \) -exec mv -f -t /workspaces/1234/result/ {} +)",
        R"(find . -maxdepth 1 -type f \( -name '*.packages' \) -exec mv -f -t /workspaces/1234/result/ {} +)",
        R"(find . -maxdepth 1 -type f \( -name '*.b2sum' \) -exec mv -f -t /workspaces/1234/result/ {} +)",
        R"(find . -maxdepth 1 -type f \( -name '*.sha256sum' \) -exec mv -f -t /workspaces/1234/result/ {} +)",
    };

    ASSERT_EQ(makeIsoBuildScript(params()).lines(), expected);
}

TEST(makeIsoBuildScript, flavorIsExportedAfterClone)
{
    auto lines = makeIsoBuildScript(params("minimal")).lines();

    ASSERT_EQ(lines.size(), makeIsoBuildScript(params()).lines().size() + 1);
    ASSERT_EQ(lines[3], "cd ./lb");
    ASSERT_EQ(lines[4], "export FLAVOR='minimal'");
    ASSERT_EQ(lines[5], "lb config");
}

TEST(makeIsoBuildScript, flavorIsShellEscaped)
{
    auto lines = makeIsoBuildScript(params("it's $(evil)")).lines();

    ASSERT_EQ(lines[4], "export FLAVOR='it'\\''s $(evil)'");
}

TEST(makeIsoBuildScript, repositoryIsShellEscaped)
{
    auto p = params();
    p.liveBuildGit = "https://example.org/lb.git; rm -rf /";

    ASSERT_EQ(
        makeIsoBuildScript(p).lines()[2],
        "git clone --depth=2 'https://example.org/lb.git; rm -rf /' /workspaces/1234/lb");
}

TEST(makeIsoBuildScript, isoMoveCanBeOptional)
{
    auto lines = makeIsoBuildScript(params("", false)).lines();

    ASSERT_EQ(lines[8], R"(find . -maxdepth 1 -type f \( -name '*.iso' \) -exec mv -f -t /workspaces/1234/result/ {} +)");
}

TEST(makeIsoBuildScript, isDeterministic)
{
    ASSERT_EQ(makeIsoBuildScript(params("minimal")), makeIsoBuildScript(params("minimal")));
    ASSERT_EQ(makeIsoBuildScript(params("minimal")).render(), makeIsoBuildScript(params("minimal")).render());
}

/* ----------------------------------------------------------------------------
 * Running the artifact collection part of the script with /bin/sh
 * --------------------------------------------------------------------------*/

/**
 * The lines following `lb build`, i.e. checksumming and moving the
 * artifacts, as a script.
 */
static CommandScript collectionScript(const Path & resultsDir, bool requireIsoArtifact)
{
    auto p = params("", requireIsoArtifact);
    p.resultsDir = resultsDir;
    auto lines = makeIsoBuildScript(p).lines();

    CommandScript script;
    bool afterBuild = false;
    for (auto & line : lines) {
        if (afterBuild)
            script.add(line);
        if (line == "lb build")
            afterBuild = true;
    }
    return script;
}

static int runCollection(const Path & buildDir, const CommandScript & script)
{
    writeFile(buildDir + "/collect.sh", script.render());
    auto [status, output] = runProgram(RunOptions{
        .program = "/bin/sh",
        .searchPath = false,
        .args = {"-e", buildDir + "/collect.sh"},
        .chdir = buildDir,
        .mergeStderrToStdout = true,
    });
    return status;
}

TEST(makeIsoBuildScript, collectsArtifacts)
{
    AutoDelete tmp(createTempDir());
    auto buildDir = tmp.path().string() + "/lb";
    auto resultsDir = tmp.path().string() + "/result";
    createDirs(buildDir);
    createDirs(resultsDir);

    writeFile(buildDir + "/live-image-amd64.hybrid.iso", "image");
    writeFile(buildDir + "/live-image-amd64.packages", "packages");
    writeFile(buildDir + "/live-image-amd64.files", "files");

    ASSERT_TRUE(statusOk(runCollection(buildDir, collectionScript(resultsDir, true))));

    for (auto name :
         {"live-image-amd64.hybrid.iso",
          "live-image-amd64.packages",
          "live-image-amd64.files",
          "checksums.b2sum",
          "checksums.sha256sum"}) {
        EXPECT_TRUE(pathExists(resultsDir + "/" + name)) << name;
        EXPECT_FALSE(pathExists(buildDir + "/" + name)) << name;
    }

    /* Only the checksummed classes are listed, in name order. */
    auto sums = tokenizeString<std::vector<std::string>>(readFile(resultsDir + "/checksums.sha256sum"), "\n");
    ASSERT_EQ(sums.size(), 2u);
    ASSERT_THAT(sums[0], testing::EndsWith("  live-image-amd64.hybrid.iso"));
    ASSERT_THAT(sums[1], testing::EndsWith("  live-image-amd64.packages"));

    auto b2sums = tokenizeString<std::vector<std::string>>(readFile(resultsDir + "/checksums.b2sum"), "\n");
    ASSERT_EQ(b2sums.size(), 2u);
    /* 256-bit digests are 64 hex digits. */
    ASSERT_EQ(b2sums[0].find(' '), 64u);
}

TEST(makeIsoBuildScript, missingIsoFailsOnlyWhenRequired)
{
    AutoDelete tmp(createTempDir());
    auto buildDir = tmp.path().string() + "/lb";
    auto resultsDir = tmp.path().string() + "/result";
    createDirs(buildDir);
    createDirs(resultsDir);

    writeFile(buildDir + "/live-image-amd64.contents", "contents");

    ASSERT_FALSE(statusOk(runCollection(buildDir, collectionScript(resultsDir, true))));

    ASSERT_TRUE(statusOk(runCollection(buildDir, collectionScript(resultsDir, false))));
    ASSERT_TRUE(pathExists(resultsDir + "/live-image-amd64.contents"));
}

} // namespace lbrun
