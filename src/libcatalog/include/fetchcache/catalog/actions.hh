#pragma once
///@file

#include "fetchcache/catalog/catalog.hh"
#include "fetchcache/cache/verify.hh"

namespace fetchcache {

/**
 * The sections, groups and components named on the command line.
 */
struct Selection
{
    Strings sections;
    Strings groups;
    Strings components;

    bool empty() const
    {
        return sections.empty() && groups.empty() && components.empty();
    }
};

/**
 * The ids of all components selected directly or through a section or
 * group. Throws `UsageError` for unknown ids.
 */
StringSet selectComponents(const L3Catalog & catalog, const Selection & selection);

/**
 * Print the selected sections, groups and components, or the ids of
 * everything in the catalog if nothing is selected.
 */
void showCatalog(const L3Catalog & catalog, const Selection & selection);

/**
 * Download the files of every selected component through the cache
 * and copy them into `destDir`.
 *
 * @return the paths of the copies.
 */
Paths fetchComponents(CachedFetcher & fetcher, const L3Catalog & catalog, const Selection & selection, const Path & destDir);

struct FileReport
{
    DownloadFile file;
    Path path;
    VerificationOutcome outcome;
};

/**
 * Verify the copies in `destDir` of the files of every selected
 * component. Each file is reported and checked even if earlier ones
 * failed.
 */
std::vector<FileReport> verifyComponents(const L3Catalog & catalog, const Selection & selection, const Path & destDir);

} // namespace fetchcache
