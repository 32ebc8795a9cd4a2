#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include "fetchcache/cache/cache-settings.hh"
#include "fetchcache/cache/verify.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/tests/capture-logger.hh"

namespace fetchcache {

using testing::CaptureLogging;

class VerifyTest : public ::testing::Test
{
protected:
    Path tmpDir;
    AutoDelete delTmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir.reset(tmpDir);
    }

    void TearDown() override
    {
        cacheSettings.verifyBufferSize = 64 * 1024;
    }
};

TEST_F(VerifyTest, valid)
{
    writeFile(tmpDir + "/f", "hello world\n");

    auto outcome = verifyFile(tmpDir + "/f", "6f5902ac237024bdd0c176cb93063dc4", "md5");

    ASSERT_TRUE(outcome.isValid());
    ASSERT_EQ(outcome.to_string(), "valid");
}

TEST_F(VerifyTest, ignoresCaseAndWhitespace)
{
    writeFile(tmpDir + "/f", "hello world\n");

    ASSERT_TRUE(verifyFile(tmpDir + "/f", "  6F5902AC237024BDD0C176CB93063DC4\n", "MD5").isValid());
}

TEST_F(VerifyTest, emptyFile)
{
    writeFile(tmpDir + "/f", "");

    ASSERT_TRUE(verifyFile(tmpDir + "/f", "d41d8cd98f00b204e9800998ecf8427e", "md5").isValid());
}

TEST_F(VerifyTest, mismatch)
{
    writeFile(tmpDir + "/f", "hello world!");

    auto outcome = verifyFile(tmpDir + "/f", "6f5902ac237024bdd0c176cb93063dc4", "md5");

    ASSERT_FALSE(outcome.isValid());
    auto mismatch = std::get_if<VerificationOutcome::DigestMismatch>(&outcome.raw);
    ASSERT_TRUE(mismatch);
    ASSERT_EQ(mismatch->expected, "6f5902ac237024bdd0c176cb93063dc4");
    ASSERT_EQ(mismatch->actual, "fc3ff98e8c6a0d3087d515c0473f8677");
    ASSERT_EQ(
        outcome.to_string(),
        "checksum mismatch: expected '6f5902ac237024bdd0c176cb93063dc4', got 'fc3ff98e8c6a0d3087d515c0473f8677'");
}

TEST_F(VerifyTest, missing)
{
    auto outcome = verifyFile(tmpDir + "/nope", "6f5902ac237024bdd0c176cb93063dc4", "md5");

    ASSERT_EQ(outcome, VerificationOutcome{VerificationOutcome::Missing{}});
    ASSERT_EQ(outcome.to_string(), "file is missing");
}

TEST_F(VerifyTest, danglingSymlink)
{
    ASSERT_EQ(symlink("nope", (tmpDir + "/link").c_str()), 0);

    ASSERT_EQ(
        verifyFile(tmpDir + "/link", "6f5902ac237024bdd0c176cb93063dc4", "md5"),
        VerificationOutcome{VerificationOutcome::Missing{}});
}

TEST_F(VerifyTest, followsSymlink)
{
    writeFile(tmpDir + "/f", "hello world\n");
    ASSERT_EQ(symlink("f", (tmpDir + "/link").c_str()), 0);

    ASSERT_TRUE(verifyFile(tmpDir + "/link", "6f5902ac237024bdd0c176cb93063dc4", "md5").isValid());
}

TEST_F(VerifyTest, unsupportedAlgorithm)
{
    writeFile(tmpDir + "/f", "hello world\n");

    auto outcome = verifyFile(tmpDir + "/f", "abc", "sha1");

    ASSERT_EQ(outcome, VerificationOutcome{VerificationOutcome::UnsupportedAlgorithm{"sha1"}});
    ASSERT_EQ(outcome.to_string(), "unsupported checksum type 'sha1'");
}

TEST_F(VerifyTest, unsupportedAlgorithmCheckedFirst)
{
    ASSERT_EQ(
        verifyFile(tmpDir + "/nope", "abc", "crc32"),
        VerificationOutcome{VerificationOutcome::UnsupportedAlgorithm{"crc32"}});
}

TEST_F(VerifyTest, chunkedProgress)
{
    cacheSettings.verifyBufferSize = 4;
    writeFile(tmpDir + "/f", "0123456789");

    CaptureLogging captureLogging(lvlTalkative);

    ASSERT_TRUE(verifyFile(tmpDir + "/f", "781e5e245d69b566979b86e28d23f2c7", "md5").isValid());

    auto & capture = captureLogging.get();
    ASSERT_EQ(capture.activities, std::vector<ActivityType>{actVerifyFile});
    ASSERT_EQ(capture.progress.size(), 3);
    ASSERT_EQ(capture.progress[0].done, 4);
    ASSERT_EQ(capture.progress[1].done, 8);
    ASSERT_EQ(capture.progress[2].done, 10);
    for (auto & p : capture.progress)
        ASSERT_EQ(p.expected, 10);
}

TEST_F(VerifyTest, zeroBufferSize)
{
    cacheSettings.verifyBufferSize = 0;
    writeFile(tmpDir + "/f", "hello world\n");

    ASSERT_THROW(verifyFile(tmpDir + "/f", "6f5902ac237024bdd0c176cb93063dc4", "md5"), UsageError);
}

TEST_F(VerifyTest, directory)
{
    ASSERT_THROW(verifyFile(tmpDir, "6f5902ac237024bdd0c176cb93063dc4", "md5"), SysError);
}

} // namespace fetchcache
