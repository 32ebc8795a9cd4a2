#include "fetchcache/cache/cache-settings.hh"
#include "fetchcache/cache/cached-fetcher.hh"
#include "fetchcache/cache/filetransfer.hh"
#include "fetchcache/catalog/actions.hh"
#include "fetchcache/catalog/catalog.hh"
#include "fetchcache/main/shared.hh"
#include "fetchcache/util/config-global.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/logging.hh"
#include "fetchcache/util/util.hh"

namespace fetchcache {

static const char * usage =
    R"(Usage: fetchcache [OPTION]... ACTION [ACTION-OPTION]...

Fetch files through a local revalidating HTTP cache, and fetch or
verify the components of a release described by an SDK catalog.

Actions:
  show     list the sections, groups and components of a release
  fetch    download the files of the selected components
  verify   check the downloaded files against their checksums
  get URL  fetch one URL through the cache and print the cached path
  show-config
           print the current settings

Options:
  -c, --sdkm-config PATH       catalog configuration file
  -p, --product-category NAME  product category to select
  -t, --target-os NAME         target operating system to select
  -r, --release NAME           release to select
  -d, --dest DIR               download directory for fetch and verify
  -v, --verbose                increase the logging verbosity level
  -q, --quiet                  decrease the logging verbosity level
  -g, --debug                  set the logging verbosity level to 'debug'
  --option NAME VALUE          set the configuration setting NAME
  --log-format raw|json        set the format of log output
  --help                       show this help
  --version                    show the version

Action options for show, fetch and verify:
  -s, --section ID             select the components of a section
  -g, --group ID               select the components of a group
  -c, --component ID           select a component
)";

enum struct Action { Show, Fetch, Verify, Get, ShowConfig };

static std::optional<Action> parseAction(std::string_view s)
{
    if (s == "show")
        return Action::Show;
    if (s == "fetch")
        return Action::Fetch;
    if (s == "verify")
        return Action::Verify;
    if (s == "get")
        return Action::Get;
    if (s == "show-config")
        return Action::ShowConfig;
    return std::nullopt;
}

static L3Catalog loadRelease(
    CachedFetcher & fetcher,
    const Path & configPath,
    const std::optional<std::string> & category,
    const std::optional<std::string> & targetOS,
    const std::optional<std::string> & release)
{
    auto config = CatalogConfig::load(configPath);

    auto l1 = L1Catalog::fetch(fetcher, config.mainRepoUrl);
    auto & productLine = l1.selectProductLine(category, targetOS);

    auto l2 = L2Catalog::fetch(fetcher, productLine.releasesIndexUrl);

    return L3Catalog::fetch(fetcher, l2.selectRelease(release));
}

static int main_fetchcache(int argc, char ** argv)
{
    initFetchcache();

    std::optional<Action> action;
    std::optional<Path> configPath;
    std::optional<std::string> category, targetOS, release;
    Path destDir = ".";
    Selection selection;
    Strings args;

    parseCmdLine(argc, argv, [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help") {
            logger->cout("%s", chomp(usage));
            throw Exit();
        } else if (*arg == "--version")
            printVersion("fetchcache");

        /* Before the action, `-c' and `-g' are global options;
           after it they select catalog entries. */
        else if (!action) {
            if (*arg == "-c" || *arg == "--sdkm-config")
                configPath = absPath(getArg(*arg, arg, end));
            else if (*arg == "-p" || *arg == "--product-category")
                category = getArg(*arg, arg, end);
            else if (*arg == "-t" || *arg == "--target-os")
                targetOS = getArg(*arg, arg, end);
            else if (*arg == "-r" || *arg == "--release")
                release = getArg(*arg, arg, end);
            else if (*arg == "-d" || *arg == "--dest")
                destDir = getArg(*arg, arg, end);
            else if (*arg == "-g")
                verbosity = lvlDebug;
            else if (hasPrefix(*arg, "-"))
                return false;
            else {
                action = parseAction(*arg);
                if (!action)
                    throw UsageError(
                        "unknown action '%s'; valid actions are: show, fetch, verify, get, show-config", *arg);
            }
        }

        else if (*arg == "-s" || *arg == "--section")
            selection.sections.push_back(getArg(*arg, arg, end));
        else if (*arg == "-g" || *arg == "--group")
            selection.groups.push_back(getArg(*arg, arg, end));
        else if (*arg == "-c" || *arg == "--component")
            selection.components.push_back(getArg(*arg, arg, end));
        else if (hasPrefix(*arg, "-"))
            return false;
        else
            args.push_back(*arg);

        return true;
    });

    globalConfig.warnUnknownSettings();

    if (!action)
        throw UsageError("no action specified");

    if (*action == Action::ShowConfig) {
        logger->cout("%s", chomp(globalConfig.toKeyValue()));
        return 0;
    }

    auto fileTransfer = makeFileTransfer();
    CachedFetcher fetcher(*fileTransfer, cacheSettings.getCacheRoot());

    if (*action == Action::Get) {
        if (args.size() != 1)
            throw UsageError("'get' requires exactly one URL");
        auto artifact = fetcher.fetch(args.front());
        logger->cout("%s", artifact.dataPath);
        return 0;
    }

    if (!args.empty())
        throw UsageError("unexpected argument '%s'", args.front());

    if (!configPath)
        throw UsageError("no catalog configuration specified; use '--sdkm-config'");

    auto catalog = loadRelease(fetcher, *configPath, category, targetOS, release);

    switch (*action) {
    case Action::Show:
        showCatalog(catalog, selection);
        break;
    case Action::Fetch:
        fetchComponents(fetcher, catalog, selection, absPath(destDir));
        break;
    case Action::Verify: {
        auto reports = verifyComponents(catalog, selection, absPath(destDir));
        size_t failed = 0;
        for (auto & report : reports)
            if (!report.outcome.isValid())
                failed++;
        if (failed) {
            printError("%d of %d files failed verification", failed, reports.size());
            return 1;
        }
        break;
    }
    default:
        break;
    }

    return 0;
}

} // namespace fetchcache

int main(int argc, char ** argv)
{
    return fetchcache::handleExceptions(argv[0], [&]() {
        auto status = fetchcache::main_fetchcache(argc, argv);
        if (status)
            throw fetchcache::Exit(status);
    });
}
