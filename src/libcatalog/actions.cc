#include "fetchcache/catalog/actions.hh"
#include "fetchcache/cache/cached-fetcher.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/util.hh"

namespace fetchcache {

StringSet selectComponents(const L3Catalog & catalog, const Selection & selection)
{
    StringSet ids;

    for (auto & id : selection.components) {
        if (!catalog.getComponent(id))
            throw UsageError(
                "unknown component '%s'; valid choices are: %s", id, concatStringsSep(", ", catalog.componentIds()));
        ids.insert(id);
    }

    for (auto & section : selection.sections)
        ids.merge(catalog.componentsForSection(section));

    for (auto & group : selection.groups)
        ids.merge(catalog.componentsForGroup(group));

    return ids;
}

void showCatalog(const L3Catalog & catalog, const Selection & selection)
{
    if (selection.empty()) {
        logger->cout("Package sections:");
        for (auto & id : catalog.sectionIds())
            logger->cout("\t%s", id);

        logger->cout("Package groups:");
        for (auto & id : catalog.groupIds())
            logger->cout("\t%s", id);

        logger->cout("Package components:");
        for (auto & id : catalog.componentIds())
            logger->cout("\t%s", id);

        return;
    }

    for (auto & id : selection.sections) {
        auto section = catalog.getSection(id);
        if (!section)
            throw UsageError("unknown section '%s'", id);
        logger->cout("Section %s: %s[%s]", section->id, section->title, section->name);
        for (auto & groupId : section->groups)
            logger->cout("\tChild group: %s", groupId);
    }

    for (auto & id : selection.groups) {
        auto group = catalog.getGroup(id);
        if (!group)
            throw UsageError("unknown group '%s'", id);
        logger->cout("Group %s: %s[%s]", group->id, group->name, group->installedOn);
        logger->cout("\tDescription: %s", group->description);
        for (auto & version : group->versions) {
            logger->cout("\tVersion %s components:", version.version);
            for (auto & [componentId, componentVersion] : version.components)
                logger->cout("\t\t%s", componentId);
        }
    }

    for (auto & id : selection.components) {
        auto component = catalog.getComponent(id);
        if (!component)
            throw UsageError("unknown component '%s'", id);
        logger->cout("Component %s: %s[%s]", component->id, component->name, component->compType);
        logger->cout("\tDescription: %s", component->description);
        for (auto & version : component->versions) {
            logger->cout("\tVersion %s:", version.version);
            logger->cout("\t\tInstall size: %s MB", version.installSizeMB);
            for (auto & os : version.operatingSystems)
                logger->cout("\t\tSupported OS: %s", os);
            for (auto & targetId : version.targetIds)
                logger->cout("\t\tSupported HW: %s", targetId);
            for (auto & file : version.downloadFiles)
                logger->cout("\t\tPackage %s", file.fileName);
        }
    }
}

/**
 * The download files of the selected components, in component order.
 */
static std::vector<DownloadFile> selectFiles(const L3Catalog & catalog, const Selection & selection)
{
    std::vector<DownloadFile> files;
    for (auto & id : selectComponents(catalog, selection)) {
        auto component = catalog.getComponent(id);
        if (!component)
            throw BadCatalog("component '%s' is referenced by a group but not defined in '%s'", id, catalog.source);
        for (auto & version : component->versions)
            for (auto & file : version.downloadFiles)
                files.push_back(file);
    }
    return files;
}

/**
 * The path of a file in `destDir`. File names from the catalog must
 * not escape it.
 */
static Path destPath(const Path & destDir, const DownloadFile & file)
{
    if (file.fileName.empty() || file.fileName == "." || file.fileName == ".."
        || file.fileName.find('/') != std::string::npos)
        throw BadCatalog("invalid file name '%s' for '%s'", file.fileName, file.url);
    return destDir + "/" + file.fileName;
}

Paths fetchComponents(CachedFetcher & fetcher, const L3Catalog & catalog, const Selection & selection, const Path & destDir)
{
    auto files = selectFiles(catalog, selection);

    if (files.empty()) {
        warn("nothing to fetch");
        return {};
    }

    createDirs(destDir);

    Paths paths;
    for (auto & file : files) {
        auto dest = destPath(destDir, file);
        auto artifact = fetcher.fetch(file.url);
        debug("copying '%s' to '%s'", artifact.dataPath, dest);
        artifact.copyToFile(dest);
        printInfo("fetched '%s'", dest);
        paths.push_back(dest);
    }

    return paths;
}

std::vector<FileReport> verifyComponents(const L3Catalog & catalog, const Selection & selection, const Path & destDir)
{
    std::vector<FileReport> reports;

    for (auto & file : selectFiles(catalog, selection)) {
        auto path = destPath(destDir, file);
        auto outcome = verifyFile(path, file.checksum, file.checksumType);

        if (outcome.isValid())
            printInfo("%s: %s", path, outcome.to_string());
        else
            printError("%s: %s", path, outcome.to_string());

        reports.push_back(FileReport{.file = file, .path = path, .outcome = std::move(outcome)});
    }

    return reports;
}

} // namespace fetchcache
