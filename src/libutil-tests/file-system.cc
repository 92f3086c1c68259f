#include "lbrun/util/file-system.hh"

#include <gtest/gtest.h>

#include <climits>
#include <optional>

#include <sys/stat.h>
#include <unistd.h>

namespace lbrun {

/* ----------------------------------------------------------------------------
 * absPath
 * --------------------------------------------------------------------------*/

TEST(absPath, doesntChangeRoot)
{
    ASSERT_EQ(absPath("/"), "/");
}

TEST(absPath, turnsEmptyPathIntoCWD)
{
    char cwd[PATH_MAX + 1];
    auto p = absPath("");

    ASSERT_EQ(p, getcwd(cwd, PATH_MAX));
}

TEST(absPath, usesOptionalBasePathWhenGiven)
{
    ASSERT_EQ(absPath("lbrun.conf", "/etc/lbrun"), "/etc/lbrun/lbrun.conf");
}

TEST(absPath, isIdempotent)
{
    ASSERT_EQ(absPath("/etc/lbrun/../lbrun//"), "/etc/lbrun");
}

/* ----------------------------------------------------------------------------
 * canonPath, dirOf, baseNameOf
 * --------------------------------------------------------------------------*/

TEST(canonPath, removesTrailingSlashes)
{
    ASSERT_EQ(canonPath("/workspaces/job/"), "/workspaces/job");
}

TEST(canonPath, removesDots)
{
    ASSERT_EQ(canonPath("/workspaces/./job/../other"), "/workspaces/other");
}

TEST(canonPath, collapsesSlashes)
{
    ASSERT_EQ(canonPath("//tmp///lbrun"), "/tmp/lbrun");
}

TEST(dirOf, returnsParent)
{
    ASSERT_EQ(dirOf("/workspaces/job/result"), "/workspaces/job");
    ASSERT_EQ(dirOf("/workspaces"), "/");
}

TEST(baseNameOf, returnsLastComponent)
{
    ASSERT_EQ(baseNameOf("/tmp/job-commands.sh"), "job-commands.sh");
    ASSERT_EQ(baseNameOf("/tmp/dir/"), "dir");
    ASSERT_EQ(baseNameOf("lbrun-iso"), "lbrun-iso");
}

/* ----------------------------------------------------------------------------
 * readFile, writeFile, copyFile
 * --------------------------------------------------------------------------*/

TEST(writeFile, writesContentsAndMode)
{
    AutoDelete dir(createTempDir());
    auto path = dir.path().string() + "/script.sh";

    writeFile(path, "#!/bin/sh\ntrue\n", 0755);

    ASSERT_TRUE(pathExists(path));
    ASSERT_EQ(readFile(path), "#!/bin/sh\ntrue\n");

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    ASSERT_EQ(st.st_mode & 0777, 0755u);
}

TEST(readFile, missingFileThrows)
{
    ASSERT_THROW(readFile("/nonexistent/lbrun/file"), SysError);
}

TEST(copyFile, copiesContents)
{
    AutoDelete dir(createTempDir());
    auto from = dir.path().string() + "/from";
    auto to = dir.path().string() + "/sub/to";

    writeFile(from, "payload");
    createDirs(dirOf(to));
    copyFile(from, to);

    ASSERT_EQ(readFile(to), "payload");
}

/* ----------------------------------------------------------------------------
 * AutoDelete
 * --------------------------------------------------------------------------*/

TEST(AutoDelete, deletesOnScopeExit)
{
    Path path;
    {
        AutoDelete dir(createTempDir());
        path = dir.path().string();
        writeFile(path + "/file", "x");
        ASSERT_TRUE(pathExists(path));
    }
    ASSERT_FALSE(pathExists(path));
}

TEST(AutoDelete, cancelKeepsPath)
{
    Path path;
    {
        AutoDelete dir(createTempDir());
        path = dir.path().string();
        dir.cancel();
    }
    ASSERT_TRUE(pathExists(path));
    deletePath(path);
    ASSERT_FALSE(pathExists(path));
}

TEST(AutoDelete, moveTransfersOwnership)
{
    Path path;
    {
        std::optional<AutoDelete> outer;
        {
            AutoDelete inner(createTempDir());
            path = inner.path().string();
            outer.emplace(std::move(inner));
        }
        ASSERT_TRUE(pathExists(path));
    }
    ASSERT_FALSE(pathExists(path));
}

} // namespace lbrun
