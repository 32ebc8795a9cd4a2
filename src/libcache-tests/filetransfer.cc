#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fetchcache/cache/filetransfer.hh"
#include "fetchcache/util/tests/gmock-matchers.hh"

namespace fetchcache {

using testing::HasSubstrIgnoreANSIMatcher;

TEST(FileTransfer, classifyStatus)
{
    ASSERT_EQ(FileTransfer::classifyStatus(404), FileTransfer::NotFound);
    ASSERT_EQ(FileTransfer::classifyStatus(410), FileTransfer::NotFound);
    ASSERT_EQ(FileTransfer::classifyStatus(401), FileTransfer::Forbidden);
    ASSERT_EQ(FileTransfer::classifyStatus(403), FileTransfer::Forbidden);
    ASSERT_EQ(FileTransfer::classifyStatus(407), FileTransfer::Forbidden);
    ASSERT_EQ(FileTransfer::classifyStatus(408), FileTransfer::Transient);
    ASSERT_EQ(FileTransfer::classifyStatus(429), FileTransfer::Transient);
    ASSERT_EQ(FileTransfer::classifyStatus(500), FileTransfer::Transient);
    ASSERT_EQ(FileTransfer::classifyStatus(503), FileTransfer::Transient);
    ASSERT_EQ(FileTransfer::classifyStatus(501), FileTransfer::Misc);
    ASSERT_EQ(FileTransfer::classifyStatus(505), FileTransfer::Misc);
    ASSERT_EQ(FileTransfer::classifyStatus(511), FileTransfer::Misc);
    ASSERT_EQ(FileTransfer::classifyStatus(400), FileTransfer::Misc);
}

TEST(FileTransferResult, isSuccess)
{
    FileTransferResult result;
    ASSERT_TRUE(result.isSuccess());

    for (unsigned int status : {200, 204, 299}) {
        result.status = status;
        ASSERT_TRUE(result.isSuccess());
    }

    for (unsigned int status : {199, 300, 304, 404, 500}) {
        result.status = status;
        ASSERT_FALSE(result.isSuccess());
    }
}

TEST(FileTransferResult, headers)
{
    FileTransferResult result;
    result.headers = {
        {"cache-control", "public"},
        {"etag", "\"v1\""},
        {"cache-control", "max-age=60"},
    };

    ASSERT_EQ(result.header("etag"), "\"v1\"");
    ASSERT_EQ(result.header("cache-control"), "public");
    ASSERT_FALSE(result.header("last-modified").has_value());
    ASSERT_EQ(result.headerValues("cache-control"), (Strings{"public", "max-age=60"}));
    ASSERT_TRUE(result.headerValues("expires").empty());
}

TEST(FileTransferError, showsShortResponseBody)
{
    FileTransferError e(FileTransfer::Misc, "rate limited", "unable to download '%s'", "https://example.com/");

    ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("unable to download 'https://example.com/'"));
    ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("response body:\n\nrate limited"));
}

TEST(FileTransferError, hidesBodyOfNotFound)
{
    FileTransferError e(FileTransfer::NotFound, "<html>gone</html>", "unable to download '%s'", "https://example.com/");

    ASSERT_THAT(e.what(), ::testing::Not(HasSubstrIgnoreANSIMatcher("gone")));
}

TEST(FileTransferError, hidesLongBody)
{
    FileTransferError e(FileTransfer::Misc, std::string(2048, 'x'), "unable to download '%s'", "https://example.com/");

    ASSERT_THAT(e.what(), ::testing::Not(HasSubstrIgnoreANSIMatcher("response body")));
}

TEST(HttpStatusError, message)
{
    FileTransferResult result;
    result.status = 403;
    result.statusMsg = "Forbidden";

    HttpStatusError e("https://example.com/file", result);

    ASSERT_EQ(e.status, 403);
    ASSERT_EQ(e.error, FileTransfer::Forbidden);
    ASSERT_THAT(
        e.what(), HasSubstrIgnoreANSIMatcher("unable to download 'https://example.com/file': HTTP error 403 ('Forbidden')"));
}

} // namespace fetchcache
