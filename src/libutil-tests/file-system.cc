#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/serialise.hh"
#include "fetchcache/util/util.hh"

#include <limits.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace fetchcache {

/* ----------- tests for file-system.hh -------------------------------------*/

/* ----------------------------------------------------------------------------
 * absPath
 * --------------------------------------------------------------------------*/

TEST(absPath, doesntChangeRoot)
{
    auto p = absPath("/");

    ASSERT_EQ(p, "/");
}

TEST(absPath, turnsEmptyPathIntoCWD)
{
    char cwd[PATH_MAX + 1];
    auto p = absPath("");

    ASSERT_EQ(p, getcwd((char *) &cwd, PATH_MAX));
}

TEST(absPath, usesOptionalBasePathWhenGiven)
{
    auto p = absPath("foo/../bar", "/base");

    ASSERT_EQ(p, "/base/bar");
}

/* ----------------------------------------------------------------------------
 * canonPath
 * --------------------------------------------------------------------------*/

TEST(canonPath, removesTrailingSlashes)
{
    ASSERT_EQ(canonPath("/this/is/a/path//"), "/this/is/a/path");
}

TEST(canonPath, removesDots)
{
    ASSERT_EQ(canonPath("/this/./is/a/path/./"), "/this/is/a/path");
}

TEST(canonPath, removesDots2)
{
    ASSERT_EQ(canonPath("/this/a/../is/a////path/foo/.."), "/this/is/a/path");
}

TEST(canonPath, requiresAbsolutePath)
{
    ASSERT_ANY_THROW(canonPath("."));
    ASSERT_ANY_THROW(canonPath(".."));
    ASSERT_ANY_THROW(canonPath("../"));
    ASSERT_THROW(canonPath(""), Error);
}

/* ----------------------------------------------------------------------------
 * dirOf
 * --------------------------------------------------------------------------*/

TEST(dirOf, returnsEmptyStringForRoot)
{
    auto p = dirOf("/");

    ASSERT_EQ(p, "/");
}

TEST(dirOf, returnsFirstPathComponent)
{
    auto p1 = dirOf("/dir/");
    ASSERT_EQ(p1, "/dir");
    auto p2 = dirOf("/dir");
    ASSERT_EQ(p2, "/");
    auto p3 = dirOf("/dir/..");
    ASSERT_EQ(p3, "/dir");
    auto p4 = dirOf("/dir/../");
    ASSERT_EQ(p4, "/dir/..");
}

/* ----------------------------------------------------------------------------
 * baseNameOf
 * --------------------------------------------------------------------------*/

TEST(baseNameOf, emptyPath)
{
    auto p1 = baseNameOf("");
    ASSERT_EQ(p1, "");
}

TEST(baseNameOf, pathOnRoot)
{
    auto p1 = baseNameOf("/dir");
    ASSERT_EQ(p1, "dir");
}

TEST(baseNameOf, relativePath)
{
    auto p1 = baseNameOf("dir/foo");
    ASSERT_EQ(p1, "foo");
}

TEST(baseNameOf, pathWithTrailingSlashRoot)
{
    auto p1 = baseNameOf("/");
    ASSERT_EQ(p1, "");
}

TEST(baseNameOf, trailingSlash)
{
    auto p1 = baseNameOf("/dir/");
    ASSERT_EQ(p1, "dir");
}

/* ----------------------------------------------------------------------------
 * readFile, writeFile, renameFile, copyFile
 * --------------------------------------------------------------------------*/

class FileSystemTest : public ::testing::Test
{
protected:
    Path tmpDir;
    AutoDelete delTmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir.reset(tmpDir);
    }
};

TEST_F(FileSystemTest, writeThenRead)
{
    auto path = tmpDir + "/file";
    writeFile(path, "hello\n");

    ASSERT_TRUE(pathExists(path));
    ASSERT_EQ(readFile(path), "hello\n");
}

TEST_F(FileSystemTest, writeFromSource)
{
    auto path = tmpDir + "/file";
    std::string contents = "streamed contents";
    StringSource source{contents};
    writeFile(path, source, 0644, FsSync::Yes);

    ASSERT_EQ(readFile(path), "streamed contents");
}

TEST_F(FileSystemTest, readIntoSink)
{
    auto path = tmpDir + "/file";
    writeFile(path, "sink contents");

    StringSink sink;
    readFile(path, sink);
    ASSERT_EQ(sink.s, "sink contents");
}

TEST_F(FileSystemTest, readMissingFile)
{
    ASSERT_THROW(readFile(tmpDir + "/missing"), SysError);
    ASSERT_FALSE(maybeLstat(tmpDir + "/missing").has_value());
    ASSERT_FALSE(pathExists(tmpDir + "/missing/child"));
}

TEST_F(FileSystemTest, createDirsIsIdempotent)
{
    auto dir = tmpDir + "/a/b/c";
    createDirs(dir);
    createDirs(dir);

    ASSERT_TRUE(S_ISDIR(stat(dir).st_mode));
}

TEST_F(FileSystemTest, renameReplacesTarget)
{
    writeFile(tmpDir + "/old", "new contents");
    writeFile(tmpDir + "/target", "old contents");
    renameFile(tmpDir + "/old", tmpDir + "/target");

    ASSERT_FALSE(pathExists(tmpDir + "/old"));
    ASSERT_EQ(readFile(tmpDir + "/target"), "new contents");
}

TEST_F(FileSystemTest, copyOverwrites)
{
    writeFile(tmpDir + "/from", "copied");
    writeFile(tmpDir + "/to", "stale");
    copyFile(tmpDir + "/from", tmpDir + "/to");

    ASSERT_EQ(readFile(tmpDir + "/from"), "copied");
    ASSERT_EQ(readFile(tmpDir + "/to"), "copied");
}

TEST_F(FileSystemTest, autoDeleteRemovesFile)
{
    auto path = tmpDir + "/temporary";
    {
        AutoDelete del(path, false);
        writeFile(path, "x");
    }
    ASSERT_FALSE(pathExists(path));
}

TEST_F(FileSystemTest, autoDeleteCancel)
{
    auto path = tmpDir + "/kept";
    {
        AutoDelete del(path, false);
        writeFile(path, "x");
        del.cancel();
    }
    ASSERT_TRUE(pathExists(path));
}

TEST(makeTempPath, uniquePaths)
{
    auto a = makeTempPath("/tmp/root");
    auto b = makeTempPath("/tmp/root");

    ASSERT_NE(a, b);
    ASSERT_TRUE(hasPrefix(a, "/tmp/root.tmp-"));
}

} // namespace fetchcache
