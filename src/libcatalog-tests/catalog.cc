#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "fetchcache/cache/cached-fetcher.hh"
#include "fetchcache/cache/tests/fake-file-transfer.hh"
#include "fetchcache/catalog/catalog.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/tests/capture-logger.hh"
#include "fetchcache/util/tests/gmock-matchers.hh"

namespace fetchcache {

using testing::CaptureLogging;
using testing::FakeFileTransfer;
using testing::HasSubstrIgnoreANSIMatcher;

static const std::string l1Url = "https://example.com/sdk/catalog.json";
static const std::string l2Url = "https://example.com/sdk/mcu/linux/releases.json";
static const std::string l3Url = "https://example.com/sdk/mcu/linux/2024.1/components.json";

static const auto l1Json = R"({
    "information": { "title": "SDK Catalog", "version": "1.0" },
    "productCategories": [
        {
            "categoryName": "MCU",
            "productLines": [
                {
                    "targetOS": "linux",
                    "targetType": "board",
                    "serverType": ["http"],
                    "releasesIndexURL": "mcu/linux/releases.json"
                },
                {
                    "targetOS": "windows",
                    "releasesIndexURL": "https://mirror.example.org/mcu/windows/releases.json"
                }
            ]
        },
        {
            "categoryName": "DSP",
            "productLines": []
        }
    ]
})"_json;

static const auto l2Json = R"({
    "information": { "title": "MCU releases" },
    "releases": [
        {
            "title": "2024.1",
            "productCategory": "MCU",
            "targetOS": "linux",
            "releaseVersion": "2024.1.0",
            "compRepoURL": "2024.1/components.json"
        },
        {
            "title": "legacy"
        }
    ]
})"_json;

static const auto l3Json = R"({
    "compDirectory": "files/",
    "sections": [
        { "id": "core", "name": "Core", "title": "Core packages", "groups": ["base"] }
    ],
    "groups": {
        "base": {
            "name": "Base",
            "installedOn": "host",
            "description": "Base tools",
            "versions": [
                { "version": "1.0", "components": [ { "id": "compiler", "version": "1.0" }, { "id": "debugger" } ] }
            ]
        },
        "extras": {
            "name": "Extras",
            "versions": [ { "version": "1.0", "components": [ { "id": "docs" } ] } ]
        }
    },
    "components": {
        "compiler": {
            "name": "Compiler",
            "description": "C compiler",
            "compType": "tool",
            "versions": [
                {
                    "version": "1.0",
                    "operatingSystems": ["linux"],
                    "installSizeMB": 12.5,
                    "targetIds": ["arm"],
                    "downloadFiles": [
                        {
                            "url": "compiler-1.0.tar.gz",
                            "fileName": "compiler-1.0.tar.gz",
                            "size": 12,
                            "checksum": "6f5902ac237024bdd0c176cb93063dc4",
                            "checksumType": "md5"
                        }
                    ]
                }
            ]
        },
        "debugger": {
            "name": "Debugger",
            "versions": [
                {
                    "version": "2.0",
                    "downloadFiles": [
                        {
                            "url": "/mirror/debugger.tar.gz",
                            "fileName": "debugger.tar.gz",
                            "size": 10,
                            "checksum": "781E5E245D69B566979B86E28D23F2C7",
                            "checksumType": "MD5"
                        }
                    ]
                }
            ]
        },
        "docs": {
            "name": "Documentation",
            "versions": [ { "version": "1.0" } ]
        }
    }
})"_json;

/* ----------------------------------------------------------------------------
 * CatalogConfig
 * --------------------------------------------------------------------------*/

TEST(CatalogConfig, fromJSON)
{
    auto config = CatalogConfig::fromJSON(R"({
        "mainRepoURL": "https://example.com/sdk/./catalog.json",
        "PIDServer": "https://pid.example.com"
    })"_json);

    ASSERT_EQ(config.mainRepoUrl, l1Url);
    ASSERT_EQ(config.pidServer, "https://pid.example.com");
    ASSERT_EQ(config.devZoneServer, "");
}

TEST(CatalogConfig, load)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir);

    writeFile(tmpDir + "/sdkm.json", R"({ "mainRepoURL": "https://example.com/sdk/catalog.json" })");
    ASSERT_EQ(CatalogConfig::load(tmpDir + "/sdkm.json").mainRepoUrl, l1Url);

    writeFile(tmpDir + "/bad.json", "{ \"mainRepoURL\": ");
    ASSERT_THROW(CatalogConfig::load(tmpDir + "/bad.json"), BadCatalog);

    writeFile(tmpDir + "/empty.json", "{}");
    ASSERT_THROW(CatalogConfig::load(tmpDir + "/empty.json"), BadCatalog);

    ASSERT_THROW(CatalogConfig::load(tmpDir + "/missing.json"), SysError);
}

/* ----------------------------------------------------------------------------
 * L1Catalog
 * --------------------------------------------------------------------------*/

TEST(L1Catalog, fromJSON)
{
    auto catalog = L1Catalog::fromJSON(l1Json, l1Url);

    ASSERT_EQ(catalog.source, l1Url);
    ASSERT_EQ(catalog.title, "SDK Catalog");
    ASSERT_EQ(catalog.version, "1.0");
    ASSERT_EQ(catalog.categoryNames(), (Strings{"MCU", "DSP"}));

    auto mcu = catalog.getProductCategory("MCU");
    ASSERT_TRUE(mcu);
    ASSERT_EQ(mcu->targetOSes(), (Strings{"linux", "windows"}));

    auto line = mcu->getProductLine("linux");
    ASSERT_TRUE(line);
    ASSERT_EQ(line->targetType, "board");
    ASSERT_EQ(line->serverType, Strings{"http"});
    ASSERT_EQ(line->releasesIndexUrl, l2Url);

    ASSERT_EQ(
        mcu->getProductLine("windows")->releasesIndexUrl, "https://mirror.example.org/mcu/windows/releases.json");
    ASSERT_FALSE(mcu->getProductLine("macos"));
    ASSERT_FALSE(catalog.getProductCategory("GPU"));
}

TEST(L1Catalog, fromJSONBadShape)
{
    try {
        L1Catalog::fromJSON(R"({ "productCategories": {} })"_json, l1Url);
        FAIL() << "a catalog without a category list should be rejected";
    } catch (BadCatalog & e) {
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("invalid product catalog '" + l1Url + "'"));
    }

    ASSERT_THROW(L1Catalog::fromJSON(R"([])"_json, l1Url), BadCatalog);
    ASSERT_THROW(
        L1Catalog::fromJSON(R"({ "productCategories": [ { "productLines": [] } ] })"_json, l1Url), BadCatalog);
}

TEST(L1Catalog, selectProductLine)
{
    auto catalog = L1Catalog::fromJSON(l1Json, l1Url);

    ASSERT_EQ(catalog.selectProductLine("MCU", "linux").releasesIndexUrl, l2Url);
}

TEST(L1Catalog, selectProductLineListsChoices)
{
    auto catalog = L1Catalog::fromJSON(l1Json, l1Url);

    auto expectUsageError = [&](std::optional<std::string> category,
                                std::optional<std::string> targetOS,
                                const std::string & expected) {
        try {
            catalog.selectProductLine(category, targetOS);
            FAIL() << "selection should fail";
        } catch (UsageError & e) {
            ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher(expected));
        }
    };

    expectUsageError(std::nullopt, "linux", "no product category specified; valid choices are: MCU, DSP");
    expectUsageError("GPU", "linux", "unknown product category 'GPU'; valid choices are: MCU, DSP");
    expectUsageError("MCU", std::nullopt, "no target OS specified; valid choices are: linux, windows");
    expectUsageError("MCU", "macos", "unknown target OS 'macos' for product category 'MCU'");
    expectUsageError("DSP", "linux", "there are none");
}

/* ----------------------------------------------------------------------------
 * L2Catalog
 * --------------------------------------------------------------------------*/

TEST(L2Catalog, fromJSON)
{
    auto catalog = L2Catalog::fromJSON(l2Json, l2Url);

    ASSERT_EQ(catalog.title, "MCU releases");
    ASSERT_EQ(catalog.releaseTitles(), (Strings{"2024.1", "legacy"}));

    auto release = catalog.getRelease("2024.1");
    ASSERT_TRUE(release);
    ASSERT_EQ(release->productCategory, "MCU");
    ASSERT_EQ(release->targetOS, "linux");
    ASSERT_EQ(release->releaseVersion, "2024.1.0");
    ASSERT_EQ(release->compRepoUrl, l3Url);

    ASSERT_FALSE(catalog.getRelease("legacy")->compRepoUrl.has_value());
}

TEST(L2Catalog, selectRelease)
{
    auto catalog = L2Catalog::fromJSON(l2Json, l2Url);

    ASSERT_EQ(catalog.selectRelease("2024.1"), l3Url);
    ASSERT_THROW(catalog.selectRelease(std::nullopt), UsageError);
    ASSERT_THROW(catalog.selectRelease("2023.4"), UsageError);
    ASSERT_THROW(catalog.selectRelease("legacy"), BadCatalog);
}

TEST(L2Catalog, fromJSONBadShape)
{
    ASSERT_THROW(L2Catalog::fromJSON(R"({ "releases": [ { "title": 1 } ] })"_json, l2Url), BadCatalog);
    ASSERT_THROW(L2Catalog::fromJSON(R"({})"_json, l2Url), BadCatalog);
}

/* ----------------------------------------------------------------------------
 * L3Catalog
 * --------------------------------------------------------------------------*/

TEST(L3Catalog, fromJSON)
{
    auto catalog = L3Catalog::fromJSON(l3Json, l3Url);

    ASSERT_EQ(catalog.compDirectory, "https://example.com/sdk/mcu/linux/2024.1/files/");
    ASSERT_EQ(catalog.sectionIds(), Strings{"core"});
    ASSERT_EQ(catalog.groupIds(), (Strings{"base", "extras"}));
    ASSERT_EQ(catalog.componentIds(), (Strings{"compiler", "debugger", "docs"}));

    auto section = catalog.getSection("core");
    ASSERT_TRUE(section);
    ASSERT_EQ(section->title, "Core packages");
    ASSERT_EQ(section->groups, Strings{"base"});

    auto group = catalog.getGroup("base");
    ASSERT_TRUE(group);
    ASSERT_EQ(group->installedOn, "host");
    ASSERT_EQ(group->versions.size(), 1);
    ASSERT_EQ(group->versions[0].components.size(), 2);
    ASSERT_EQ(group->versions[0].components[1].first, "debugger");
    ASSERT_EQ(group->versions[0].components[1].second, "");

    auto compiler = catalog.getComponent("compiler");
    ASSERT_TRUE(compiler);
    ASSERT_EQ(compiler->compType, "tool");
    ASSERT_EQ(compiler->versions.size(), 1);
    auto & version = compiler->versions[0];
    ASSERT_EQ(version.installSizeMB, 12.5);
    ASSERT_EQ(version.operatingSystems, Strings{"linux"});
    ASSERT_EQ(version.targetIds, Strings{"arm"});
    ASSERT_EQ(version.downloadFiles.size(), 1);
    ASSERT_EQ(version.downloadFiles[0].url, "https://example.com/sdk/mcu/linux/2024.1/files/compiler-1.0.tar.gz");
    ASSERT_EQ(version.downloadFiles[0].size, 12);

    ASSERT_EQ(
        catalog.getComponent("debugger")->versions[0].downloadFiles[0].url,
        "https://example.com/mirror/debugger.tar.gz");
    ASSERT_TRUE(catalog.getComponent("docs")->versions[0].downloadFiles.empty());
    ASSERT_FALSE(catalog.getComponent("nope"));
}

TEST(L3Catalog, componentsFor)
{
    auto catalog = L3Catalog::fromJSON(l3Json, l3Url);

    ASSERT_EQ(catalog.componentsForGroup("base"), (StringSet{"compiler", "debugger"}));
    ASSERT_EQ(catalog.componentsForSection("core"), (StringSet{"compiler", "debugger"}));
    ASSERT_THROW(catalog.componentsForGroup("nope"), UsageError);
    ASSERT_THROW(catalog.componentsForSection("nope"), UsageError);
}

TEST(L3Catalog, multipleGroupVersionsSelectsFirst)
{
    auto json = l3Json;
    json["groups"]["extras"]["versions"].push_back(R"({ "version": "2.0", "components": [ { "id": "compiler" } ] })"_json);
    auto catalog = L3Catalog::fromJSON(json, l3Url);

    CaptureLogging captureLogging;

    ASSERT_EQ(catalog.componentsForGroup("extras"), StringSet{"docs"});
    ASSERT_THAT(captureLogging.get().get(), HasSubstrIgnoreANSIMatcher("group 'extras' has 2 versions"));
}

TEST(L3Catalog, fromJSONBadShape)
{
    auto json = l3Json;
    json["components"]["compiler"]["versions"][0]["downloadFiles"][0].erase("checksum");

    try {
        L3Catalog::fromJSON(json, l3Url);
        FAIL() << "a download file without checksum should be rejected";
    } catch (BadCatalog & e) {
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("invalid component catalog"));
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("checksum"));
    }
}

/* ----------------------------------------------------------------------------
 * Fetching catalogs
 * --------------------------------------------------------------------------*/

class CatalogFetchTest : public ::testing::Test
{
protected:
    Path cacheRoot;
    AutoDelete delCacheRoot;
    FakeFileTransfer transfer;
    std::unique_ptr<CachedFetcher> fetcher;
    CaptureLogging captureLogging;

    void SetUp() override
    {
        cacheRoot = createTempDir();
        delCacheRoot.reset(cacheRoot);
        fetcher = std::make_unique<CachedFetcher>(transfer, cacheRoot);
    }
};

TEST_F(CatalogFetchTest, allLevels)
{
    transfer.enqueue(l1Url, {.body = l1Json.dump()});
    transfer.enqueue(l2Url, {.body = l2Json.dump()});
    transfer.enqueue(l3Url, {.body = l3Json.dump()});

    auto l1 = L1Catalog::fetch(*fetcher, l1Url);
    auto l2 = L2Catalog::fetch(*fetcher, l1.selectProductLine("MCU", "linux").releasesIndexUrl);
    auto l3 = L3Catalog::fetch(*fetcher, l2.selectRelease("2024.1"));

    ASSERT_EQ(l3.source, l3Url);
    ASSERT_EQ(l3.componentIds(), (Strings{"compiler", "debugger", "docs"}));

    ASSERT_EQ(transfer.requests.size(), 3);
    ASSERT_EQ(transfer.requests[0].uri, l1Url);
    ASSERT_EQ(transfer.requests[1].uri, l2Url);
    ASSERT_EQ(transfer.requests[2].uri, l3Url);
}

TEST_F(CatalogFetchTest, transferIsChildOfCatalogActivity)
{
    transfer.enqueue(l1Url, {.body = l1Json.dump()});

    CaptureLogging capture(lvlTalkative);
    L1Catalog::fetch(*fetcher, l1Url);

    ASSERT_EQ(capture.get().activities, std::vector<ActivityType>{actFetchCatalog});
    ASSERT_NE(transfer.requests[0].parentAct, 0);
    ASSERT_EQ(getCurActivity(), 0);
}

TEST_F(CatalogFetchTest, revalidates)
{
    transfer.enqueue(l1Url, {.headers = {{"ETag", "\"c1\""}}, .body = l1Json.dump()});
    transfer.enqueue(l1Url, {.status = 304});

    L1Catalog::fetch(*fetcher, l1Url);
    auto catalog = L1Catalog::fetch(*fetcher, l1Url);

    ASSERT_EQ(transfer.requests[1].header("If-None-Match"), "\"c1\"");
    ASSERT_EQ(catalog.categoryNames(), (Strings{"MCU", "DSP"}));
}

TEST_F(CatalogFetchTest, notJSON)
{
    transfer.enqueue(l1Url, {.body = "<html>maintenance</html>"});

    try {
        L1Catalog::fetch(*fetcher, l1Url);
        FAIL() << "a non-JSON catalog should be rejected";
    } catch (BadCatalog & e) {
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("invalid catalog '" + l1Url + "'"));
    }
}

TEST_F(CatalogFetchTest, httpError)
{
    ASSERT_THROW(L1Catalog::fetch(*fetcher, l1Url), HttpStatusError);
}

} // namespace fetchcache
