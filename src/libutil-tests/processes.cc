#include "lbrun/util/processes.hh"

#include <gtest/gtest.h>

#include <sys/wait.h>

namespace lbrun {

/* ----------------------------------------------------------------------------
 * statusOk
 * --------------------------------------------------------------------------*/

TEST(statusOk, zeroIsOk)
{
    ASSERT_EQ(statusOk(0), true);
    ASSERT_EQ(statusOk(1), false);
}

/* ----------------------------------------------------------------------------
 * runProgram
 * --------------------------------------------------------------------------*/

TEST(runProgram, capturesOutput)
{
    ASSERT_EQ(runProgram("/bin/sh", false, {"-c", "echo hello; echo world"}), "hello\nworld\n");
}

TEST(runProgram, throwsOnFailure)
{
    try {
        runProgram("/bin/sh", false, {"-c", "exit 3"});
        FAIL() << "expected ExecError";
    } catch (ExecError & e) {
        ASSERT_EQ(WEXITSTATUS(e.status), 3);
        ASSERT_NE(e.msg().find("failed with exit code 3"), std::string::npos);
    }
}

TEST(runProgram, returnsStatusAndOutput)
{
    auto [status, output] = runProgram(RunOptions{
        .program = "sh",
        .args = {"-c", "echo out; echo err >&2; exit 2"},
        .mergeStderrToStdout = true,
    });
    ASSERT_FALSE(statusOk(status));
    ASSERT_EQ(statusToString(status), "failed with exit code 2");
    ASSERT_EQ(output, "out\nerr\n");
}

TEST(runProgram, missingProgramFails)
{
    auto [status, output] = runProgram(RunOptions{
        .program = "/nonexistent/lbrun-test-program",
        .searchPath = false,
    });
    ASSERT_FALSE(statusOk(status));
}

TEST(runProgram, chdir)
{
    auto [status, output] = runProgram(RunOptions{
        .program = "/bin/sh",
        .searchPath = false,
        .args = {"-c", "pwd"},
        .chdir = "/",
    });
    ASSERT_TRUE(statusOk(status));
    ASSERT_EQ(output, "/\n");
}

/* ----------------------------------------------------------------------------
 * runProgram2
 * --------------------------------------------------------------------------*/

TEST(runProgram2, streamsLines)
{
    std::vector<std::string> lines;
    auto res = runProgram2(RunOptions{
        .program = "sh",
        .args = {"-c", "echo first; echo second; printf unterminated"},
        .lineCallback = [&](std::string_view line) { lines.emplace_back(line); },
    });
    ASSERT_TRUE(statusOk(res.status));
    ASSERT_FALSE(res.timedOut);
    ASSERT_FALSE(res.interrupted);
    ASSERT_EQ(lines, std::vector<std::string>({"first", "second", "unterminated"}));
    ASSERT_EQ(res.output, "");
}

TEST(runProgram2, killsOnTimeout)
{
    std::vector<std::string> lines;
    auto res = runProgram2(RunOptions{
        .program = "sh",
        .args = {"-c", "echo started; sleep 30"},
        .timeout = std::chrono::seconds(1),
        .lineCallback = [&](std::string_view line) { lines.emplace_back(line); },
    });
    ASSERT_TRUE(res.timedOut);
    ASSERT_FALSE(statusOk(res.status));
    ASSERT_EQ(lines, std::vector<std::string>({"started"}));
}

TEST(runProgram2, timeoutAppliesAfterOutputIsClosed)
{
    auto start = std::chrono::steady_clock::now();
    auto res = runProgram2(RunOptions{
        .program = "sh",
        .args = {"-c", "echo closing; exec >&- 2>&-; sleep 4"},
        .timeout = std::chrono::seconds(1),
    });
    ASSERT_TRUE(res.timedOut);
    ASSERT_FALSE(statusOk(res.status));
    ASSERT_EQ(res.output, "closing\n");
    ASSERT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST(runProgram2, interruptAppliesAfterOutputIsClosed)
{
    std::atomic<bool> interrupt{false};
    auto res = runProgram2(RunOptions{
        .program = "sh",
        .args = {"-c", "echo closing; exec >&- 2>&-; sleep 30"},
        .interrupt = &interrupt,
        .lineCallback = [&](std::string_view line) { interrupt = true; },
    });
    ASSERT_TRUE(res.interrupted);
    ASSERT_FALSE(res.timedOut);
    ASSERT_FALSE(statusOk(res.status));
}

TEST(runProgram2, interruptStopsProgram)
{
    std::atomic<bool> interrupt{true};
    auto res = runProgram2(RunOptions{
        .program = "sh",
        .args = {"-c", "sleep 30"},
        .interrupt = &interrupt,
    });
    ASSERT_TRUE(res.interrupted);
    ASSERT_FALSE(statusOk(res.status));
}

} // namespace lbrun
