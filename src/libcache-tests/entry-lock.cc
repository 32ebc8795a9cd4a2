#include <gtest/gtest.h>

#include "fetchcache/cache/entry-lock.hh"
#include "fetchcache/util/file-system.hh"

namespace fetchcache {

class EntryLockTest : public ::testing::Test
{
protected:
    Path tmpDir;
    AutoDelete delTmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir.reset(tmpDir);
    }

    /**
     * Whether another open file description could take the lock now.
     */
    bool lockAvailable(const Path & path)
    {
        auto fd = openLockFile(path, false);
        if (!fd)
            return true;
        bool res = lockFile(fd.get(), ltWrite, false);
        if (res)
            lockFile(fd.get(), ltNone, true);
        return res;
    }
};

TEST_F(EntryLockTest, createsLockFileAndDirectory)
{
    auto path = tmpDir + "/entry/lock";

    EntryLock lock(path);

    ASSERT_TRUE(lock.isLocked());
    ASSERT_TRUE(pathExists(path));
}

TEST_F(EntryLockTest, excludesOthers)
{
    auto path = tmpDir + "/entry/lock";

    {
        EntryLock lock(path);
        ASSERT_FALSE(lockAvailable(path));
    }

    ASSERT_TRUE(lockAvailable(path));
    ASSERT_TRUE(pathExists(path));
}

TEST_F(EntryLockTest, unlock)
{
    auto path = tmpDir + "/entry/lock";

    EntryLock lock(path);
    lock.unlock();

    ASSERT_FALSE(lock.isLocked());
    ASSERT_TRUE(lockAvailable(path));

    lock.unlock();
}

TEST_F(EntryLockTest, relock)
{
    auto path = tmpDir + "/entry/lock";

    {
        EntryLock lock(path);
    }
    EntryLock lock(path);

    ASSERT_TRUE(lock.isLocked());
}

TEST_F(EntryLockTest, independentEntries)
{
    EntryLock a(tmpDir + "/a/lock");

    ASSERT_TRUE(lockAvailable(tmpDir + "/b/lock"));

    EntryLock b(tmpDir + "/b/lock");
    ASSERT_TRUE(b.isLocked());
}

TEST(openLockFile, missingWithoutCreate)
{
    ASSERT_FALSE(openLockFile("/nonexistent-fetchcache-dir/lock", false));
}

TEST(openLockFile, unopenable)
{
    ASSERT_THROW(openLockFile("/nonexistent-fetchcache-dir/lock", true), SysError);
}

} // namespace fetchcache
