#include "lbrun/util/logging.hh"

#include <gtest/gtest.h>

#include <cerrno>
#include <map>

namespace lbrun {

TEST(CapturingLogger, recordsMessages)
{
    auto capture = makeCapturingLogger();

    printMsgUsing(capture, lvlError, "job '%s' failed", "1234");

    ASSERT_EQ(capture->entries.size(), 1u);
    ASSERT_EQ(capture->entries[0].level, lvlError);
    ASSERT_TRUE(capture->contains("job '1234' failed"));
    ASSERT_FALSE(capture->contains("succeeded"));
}

TEST(CapturingLogger, dropsMessagesAboveVerbosity)
{
    auto capture = makeCapturingLogger();

    printMsgUsing(capture, lvlVomit, "very noisy");

    ASSERT_TRUE(capture->entries.empty());
}

TEST(CapturingLogger, warningsArePrefixed)
{
    auto capture = makeCapturingLogger();

    capture->warn("sandbox upgrade failed");

    ASSERT_EQ(capture->entries.size(), 1u);
    ASSERT_EQ(capture->entries[0].level, lvlWarn);
    ASSERT_EQ(capture->entries[0].text, "warning: sandbox upgrade failed");
}

TEST(CapturingLogger, errorInfo)
{
    auto capture = makeCapturingLogger();

    capture->logEI(lvlWarn, Error("cannot begin session '%s'", "lbrun-1").info());

    ASSERT_EQ(capture->entries.size(), 1u);
    ASSERT_EQ(capture->entries[0].level, lvlWarn);
    ASSERT_EQ(capture->entries[0].text, "warning: cannot begin session 'lbrun-1'");
}

TEST(logError, goesThroughTheGlobalLogger)
{
    auto capture = new CapturingLogger;
    auto saved = std::move(logger);
    logger.reset(capture);

    logError(SysError(ENOENT, "opening file '%s'", "/nonexistent").info());

    auto entries = capture->entries;
    logger = std::move(saved);

    ASSERT_EQ(entries.size(), 1u);
    ASSERT_EQ(entries[0].level, lvlError);
    ASSERT_EQ(entries[0].text, "error: opening file '/nonexistent': No such file or directory");
}

TEST(Activity, buildLogLinesReachTheLogger)
{
    auto capture = makeCapturingLogger();

    {
        Activity act(*capture, lvlInfo, actRunCommand, "running 'lb build'");
        act.result(resBuildLogLine, std::string("P: Building the image"));
        act.result(resBuildLogLine, "P: Done");
    }

    ASSERT_EQ(capture->logLines, std::vector<std::string>({"P: Building the image", "P: Done"}));
}

TEST(Activity, idsAreUnique)
{
    auto capture = makeCapturingLogger();

    Activity a(*capture, actJob);
    Activity b(*capture, actSandbox);

    ASSERT_NE(a.id, b.id);
}

TEST(PushActivity, setsTheParentOfNewActivities)
{
    struct ParentLogger : Logger
    {
        std::map<ActivityId, ActivityId> parents;

        void log(Verbosity lvl, std::string_view s) override {}

        void startActivity(ActivityId act, Verbosity lvl, ActivityType type, const std::string & s, ActivityId parent)
            override
        {
            parents[act] = parent;
        }
    };

    ParentLogger logger;
    auto outer = getCurActivity();

    Activity job(logger, actJob);
    {
        PushActivity pact(job.id);
        Activity step(logger, actRunCommand);
        ASSERT_EQ(logger.parents[step.id], job.id);
    }
    ASSERT_EQ(getCurActivity(), outer);

    Activity after(logger, actRunCommand);
    ASSERT_EQ(logger.parents[after.id], outer);
}

} // namespace lbrun
