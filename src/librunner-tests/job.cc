#include <gtest/gtest.h>

#include "lbrun/runner/job.hh"
#include "lbrun/util/error.hh"

namespace lbrun {

TEST(parseJobDescriptor, object)
{
    auto job = parseJobDescriptor(R"({
        "architecture": "amd64",
        "data": {"suite": "trixie", "liveBuildGit": "https://example.org/lb.git", "flavor": null}
    })");

    ASSERT_EQ(job["architecture"], "amd64");
    ASSERT_EQ(job["data"]["suite"], "trixie");
    ASSERT_TRUE(job["data"]["flavor"].is_null());
}

TEST(parseJobDescriptor, invalidJson)
{
    ASSERT_THROW(parseJobDescriptor("{\"architecture\": "), Error);
    ASSERT_THROW(parseJobDescriptor(""), Error);
}

TEST(parseJobDescriptor, rootMustBeAnObject)
{
    ASSERT_THROW(parseJobDescriptor("[1, 2]"), Error);
    ASSERT_THROW(parseJobDescriptor("\"amd64\""), Error);
}

TEST(checkJobId, acceptsFileNameSafeIdentifiers)
{
    ASSERT_NO_THROW(checkJobId("1234"));
    ASSERT_NO_THROW(checkJobId("8f14e45f-ceea-467a-9575-2e4a8b0c9a3d"));
    ASSERT_NO_THROW(checkJobId("1700000000-4242"));
    ASSERT_NO_THROW(checkJobId("nightly_build.2"));
}

TEST(checkJobId, rejectsUnsafeIdentifiers)
{
    ASSERT_THROW(checkJobId(""), UsageError);
    ASSERT_THROW(checkJobId("."), UsageError);
    ASSERT_THROW(checkJobId(".."), UsageError);
    ASSERT_THROW(checkJobId("../etc"), UsageError);
    ASSERT_THROW(checkJobId("a/b"), UsageError);
    ASSERT_THROW(checkJobId("job 1"), UsageError);
    ASSERT_THROW(checkJobId("1;reboot"), UsageError);
}

TEST(JobContext, checkInterrupt)
{
    auto logger = makeCapturingLogger();
    JobContext ctx{.jobId = "1", .logger = *logger};

    ASSERT_FALSE(ctx.checkInterrupt());
    *ctx.interrupt = true;
    ASSERT_TRUE(ctx.checkInterrupt());

    ctx.interrupt.reset();
    ASSERT_FALSE(ctx.checkInterrupt());
}

} // namespace lbrun
