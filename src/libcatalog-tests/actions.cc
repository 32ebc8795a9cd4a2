#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "fetchcache/cache/cached-fetcher.hh"
#include "fetchcache/cache/tests/fake-file-transfer.hh"
#include "fetchcache/catalog/actions.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/tests/capture-logger.hh"
#include "fetchcache/util/tests/gmock-matchers.hh"

namespace fetchcache {

using testing::CaptureLogging;
using testing::FakeFileTransfer;
using testing::HasSubstrIgnoreANSIMatcher;

static const std::string source = "https://example.com/sdk/2024.1/components.json";
static const std::string compilerUrl = "https://example.com/sdk/2024.1/files/compiler-1.0.tar.gz";
static const std::string debuggerUrl = "https://example.com/sdk/2024.1/files/debugger.tar.gz";

static nlohmann::json catalogJson()
{
    return R"({
        "compDirectory": "files/",
        "sections": [
            { "id": "core", "name": "Core", "title": "Core packages", "groups": ["base"] },
            { "id": "extra", "name": "Extra", "title": "Extra packages", "groups": ["extras"] }
        ],
        "groups": {
            "base": {
                "name": "Base",
                "installedOn": "host",
                "description": "Base tools",
                "versions": [
                    { "version": "1.0", "components": [ { "id": "compiler" }, { "id": "debugger" } ] }
                ]
            },
            "extras": {
                "name": "Extras",
                "installedOn": "target",
                "description": "Extra things",
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
                                "url": "debugger.tar.gz",
                                "fileName": "debugger.tar.gz",
                                "size": 10,
                                "checksum": "781e5e245d69b566979b86e28d23f2c7",
                                "checksumType": "md5"
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
}

class ActionsTest : public ::testing::Test
{
protected:
    Path tmpDir;
    AutoDelete delTmpDir;
    L3Catalog catalog = L3Catalog::fromJSON(catalogJson(), source);
    CaptureLogging captureLogging;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir.reset(tmpDir);
    }

    std::string output()
    {
        return captureLogging.get().getStdout();
    }
};

/* ----------------------------------------------------------------------------
 * selectComponents
 * --------------------------------------------------------------------------*/

TEST_F(ActionsTest, selectNothing)
{
    ASSERT_TRUE(selectComponents(catalog, {}).empty());
}

TEST_F(ActionsTest, selectUnion)
{
    ASSERT_EQ(
        selectComponents(catalog, {.sections = {"core"}, .groups = {"extras"}}),
        (StringSet{"compiler", "debugger", "docs"}));
    ASSERT_EQ(
        selectComponents(catalog, {.groups = {"base"}, .components = {"compiler"}}),
        (StringSet{"compiler", "debugger"}));
    ASSERT_EQ(selectComponents(catalog, {.components = {"docs"}}), StringSet{"docs"});
}

TEST_F(ActionsTest, selectUnknown)
{
    try {
        selectComponents(catalog, {.components = {"linker"}});
        FAIL() << "an unknown component should be rejected";
    } catch (UsageError & e) {
        ASSERT_THAT(
            e.what(),
            HasSubstrIgnoreANSIMatcher("unknown component 'linker'; valid choices are: compiler, debugger, docs"));
    }

    ASSERT_THROW(selectComponents(catalog, {.sections = {"nope"}}), UsageError);
    ASSERT_THROW(selectComponents(catalog, {.groups = {"nope"}}), UsageError);
}

/* ----------------------------------------------------------------------------
 * showCatalog
 * --------------------------------------------------------------------------*/

TEST_F(ActionsTest, showEverything)
{
    showCatalog(catalog, {});

    ASSERT_EQ(
        output(),
        "Package sections:\n"
        "\tcore\n"
        "\textra\n"
        "Package groups:\n"
        "\tbase\n"
        "\textras\n"
        "Package components:\n"
        "\tcompiler\n"
        "\tdebugger\n"
        "\tdocs\n");
}

TEST_F(ActionsTest, showSection)
{
    showCatalog(catalog, {.sections = {"core"}});

    ASSERT_EQ(
        output(),
        "Section core: Core packages[Core]\n"
        "\tChild group: base\n");
}

TEST_F(ActionsTest, showGroup)
{
    showCatalog(catalog, {.groups = {"base"}});

    ASSERT_EQ(
        output(),
        "Group base: Base[host]\n"
        "\tDescription: Base tools\n"
        "\tVersion 1.0 components:\n"
        "\t\tcompiler\n"
        "\t\tdebugger\n");
}

TEST_F(ActionsTest, showComponent)
{
    showCatalog(catalog, {.components = {"compiler"}});

    ASSERT_EQ(
        output(),
        "Component compiler: Compiler[tool]\n"
        "\tDescription: C compiler\n"
        "\tVersion 1.0:\n"
        "\t\tInstall size: 12.5 MB\n"
        "\t\tSupported OS: linux\n"
        "\t\tSupported HW: arm\n"
        "\t\tPackage compiler-1.0.tar.gz\n");
}

TEST_F(ActionsTest, showUnknown)
{
    ASSERT_THROW(showCatalog(catalog, {.sections = {"nope"}}), UsageError);
    ASSERT_THROW(showCatalog(catalog, {.groups = {"nope"}}), UsageError);
    ASSERT_THROW(showCatalog(catalog, {.components = {"nope"}}), UsageError);
}

/* ----------------------------------------------------------------------------
 * fetchComponents
 * --------------------------------------------------------------------------*/

class FetchComponentsTest : public ActionsTest
{
protected:
    FakeFileTransfer transfer;
    std::unique_ptr<CachedFetcher> fetcher;

    void SetUp() override
    {
        ActionsTest::SetUp();
        fetcher = std::make_unique<CachedFetcher>(transfer, tmpDir + "/cache");
    }
};

TEST_F(FetchComponentsTest, fetchSection)
{
    transfer.enqueue(compilerUrl, {.body = "hello world\n"});
    transfer.enqueue(debuggerUrl, {.body = "0123456789"});

    auto dest = tmpDir + "/downloads";
    auto paths = fetchComponents(*fetcher, catalog, {.sections = {"core"}}, dest);

    ASSERT_EQ(paths, (Paths{dest + "/compiler-1.0.tar.gz", dest + "/debugger.tar.gz"}));
    ASSERT_EQ(readFile(dest + "/compiler-1.0.tar.gz"), "hello world\n");
    ASSERT_EQ(readFile(dest + "/debugger.tar.gz"), "0123456789");
    ASSERT_THAT(captureLogging.get().get(), HasSubstrIgnoreANSIMatcher("fetched '" + dest + "/debugger.tar.gz'"));
}

TEST_F(FetchComponentsTest, fetchAgainRevalidates)
{
    transfer.enqueue(compilerUrl, {.headers = {{"ETag", "\"c\""}}, .body = "hello world\n"});
    transfer.enqueue(compilerUrl, {.status = 304});

    auto dest = tmpDir + "/downloads";
    fetchComponents(*fetcher, catalog, {.components = {"compiler"}}, dest);
    deletePath(dest + "/compiler-1.0.tar.gz");
    fetchComponents(*fetcher, catalog, {.components = {"compiler"}}, dest);

    ASSERT_EQ(transfer.requests.size(), 2);
    ASSERT_EQ(transfer.requests[1].header("If-None-Match"), "\"c\"");
    ASSERT_EQ(readFile(dest + "/compiler-1.0.tar.gz"), "hello world\n");
}

TEST_F(FetchComponentsTest, nothingToFetch)
{
    auto dest = tmpDir + "/downloads";

    ASSERT_TRUE(fetchComponents(*fetcher, catalog, {.components = {"docs"}}, dest).empty());
    ASSERT_TRUE(transfer.requests.empty());
    ASSERT_FALSE(pathExists(dest));
    ASSERT_THAT(captureLogging.get().get(), HasSubstrIgnoreANSIMatcher("nothing to fetch"));
}

TEST_F(FetchComponentsTest, downloadFailure)
{
    transfer.enqueue(compilerUrl, {.status = 403});

    ASSERT_THROW(
        fetchComponents(*fetcher, catalog, {.components = {"compiler"}}, tmpDir + "/downloads"), HttpStatusError);
}

TEST_F(FetchComponentsTest, fileNameEscapingDestination)
{
    auto json = catalogJson();
    json["components"]["compiler"]["versions"][0]["downloadFiles"][0]["fileName"] = "../escape.tar.gz";
    auto evil = L3Catalog::fromJSON(json, source);

    ASSERT_THROW(
        fetchComponents(*fetcher, evil, {.components = {"compiler"}}, tmpDir + "/downloads"), BadCatalog);
    ASSERT_FALSE(pathExists(tmpDir + "/escape.tar.gz"));
}

TEST_F(FetchComponentsTest, undefinedComponentInGroup)
{
    auto json = catalogJson();
    json["groups"]["extras"]["versions"][0]["components"].push_back(R"({ "id": "ghost" })"_json);
    auto broken = L3Catalog::fromJSON(json, source);

    ASSERT_THROW(
        fetchComponents(*fetcher, broken, {.groups = {"extras"}}, tmpDir + "/downloads"), BadCatalog);
}

/* ----------------------------------------------------------------------------
 * verifyComponents
 * --------------------------------------------------------------------------*/

TEST_F(ActionsTest, verifyAll)
{
    writeFile(tmpDir + "/compiler-1.0.tar.gz", "hello world\n");
    writeFile(tmpDir + "/debugger.tar.gz", "9876543210");

    auto reports = verifyComponents(catalog, {.sections = {"core"}}, tmpDir);

    ASSERT_EQ(reports.size(), 2);

    ASSERT_EQ(reports[0].file.fileName, "compiler-1.0.tar.gz");
    ASSERT_EQ(reports[0].path, tmpDir + "/compiler-1.0.tar.gz");
    ASSERT_TRUE(reports[0].outcome.isValid());

    ASSERT_EQ(reports[1].file.fileName, "debugger.tar.gz");
    ASSERT_TRUE(std::holds_alternative<VerificationOutcome::DigestMismatch>(reports[1].outcome.raw));

    auto log = captureLogging.get().get();
    ASSERT_THAT(log, HasSubstrIgnoreANSIMatcher(tmpDir + "/compiler-1.0.tar.gz: valid"));
    ASSERT_THAT(log, HasSubstrIgnoreANSIMatcher(tmpDir + "/debugger.tar.gz: checksum mismatch"));
}

TEST_F(ActionsTest, verifyMissing)
{
    auto reports = verifyComponents(catalog, {.components = {"compiler", "debugger"}}, tmpDir);

    ASSERT_EQ(reports.size(), 2);
    for (auto & report : reports)
        ASSERT_EQ(report.outcome, VerificationOutcome{VerificationOutcome::Missing{}});
}

TEST_F(ActionsTest, verifyUnsupportedAlgorithm)
{
    auto json = catalogJson();
    json["components"]["compiler"]["versions"][0]["downloadFiles"][0]["checksumType"] = "sha256";
    auto other = L3Catalog::fromJSON(json, source);
    writeFile(tmpDir + "/compiler-1.0.tar.gz", "hello world\n");

    auto reports = verifyComponents(other, {.components = {"compiler"}}, tmpDir);

    ASSERT_EQ(reports.size(), 1);
    ASSERT_EQ(reports[0].outcome, VerificationOutcome{VerificationOutcome::UnsupportedAlgorithm{"sha256"}});
}

TEST_F(ActionsTest, verifyNothing)
{
    ASSERT_TRUE(verifyComponents(catalog, {.groups = {"extras"}}, tmpDir).empty());
}

} // namespace fetchcache
