#include "fetchcache/catalog/catalog.hh"
#include "fetchcache/cache/cached-fetcher.hh"
#include "fetchcache/cache/url.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/json-utils.hh"
#include "fetchcache/util/strings.hh"

#include <nlohmann/json.hpp>

namespace fetchcache {

static std::string stringAt(const nlohmann::json::object_t & obj, std::string_view key)
{
    return getString(valueAt(obj, key));
}

static std::string optionalStringAt(const nlohmann::json::object_t & obj, std::string_view key)
{
    auto * v = optionalValueAt(obj, key);
    if (!v || v->is_null())
        return "";
    return getString(*v);
}

static Strings optionalStringListAt(const nlohmann::json::object_t & obj, std::string_view key)
{
    auto * v = optionalValueAt(obj, key);
    if (!v || v->is_null())
        return {};
    return getStringList(*v);
}

/**
 * Run `parse`, reporting any structural problem as `BadCatalog`.
 */
template<typename F>
static auto parseCatalog(std::string_view what, const std::string & source, F && parse)
{
    try {
        return parse();
    } catch (BadCatalog &) {
        throw;
    } catch (Error & e) {
        throw BadCatalog("invalid %s '%s': %s", what, source, Uncolored(e.message()));
    }
}

static std::string showChoices(const Strings & choices)
{
    if (choices.empty())
        return "there are none";
    return "valid choices are: " + concatStringsSep(", ", choices);
}

static nlohmann::json fetchDocument(CachedFetcher & fetcher, const std::string & url)
{
    Activity act(*logger, lvlTalkative, actFetchCatalog, fmt("fetching catalog '%s'", url), {url});
    PushActivity pact(act.id);
    auto artifact = fetcher.fetch(url);
    return parseCatalog("catalog", url, [&]() { return artifact.json(); });
}

/* Configuration. */

CatalogConfig CatalogConfig::fromJSON(const nlohmann::json & json)
{
    auto & obj = getObject(json);
    return CatalogConfig{
        .mainRepoUrl = normaliseUrl(stringAt(obj, "mainRepoURL")),
        .pidServer = optionalStringAt(obj, "PIDServer"),
        .devZoneServer = optionalStringAt(obj, "DevZoneServer"),
    };
}

CatalogConfig CatalogConfig::load(const Path & path)
{
    auto contents = readFile(path);
    return parseCatalog("configuration file", path, [&]() {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(contents);
        } catch (nlohmann::json::parse_error & e) {
            throw Error("%s", e.what());
        }
        return fromJSON(json);
    });
}

/* L1 */

Strings ProductCategory::targetOSes() const
{
    Strings res;
    for (auto & line : productLines)
        res.push_back(line.targetOS);
    return res;
}

const ProductLine * ProductCategory::getProductLine(std::string_view targetOS) const
{
    for (auto & line : productLines)
        if (line.targetOS == targetOS)
            return &line;
    return nullptr;
}

L1Catalog L1Catalog::fromJSON(const nlohmann::json & json, const std::string & source)
{
    return parseCatalog("product catalog", source, [&]() {
        auto & obj = getObject(json);

        L1Catalog catalog;
        catalog.source = source;

        if (auto * info = optionalValueAt(obj, "information")) {
            auto & infoObj = getObject(*info);
            catalog.title = optionalStringAt(infoObj, "title");
            catalog.version = optionalStringAt(infoObj, "version");
        }

        for (auto & c : getArray(valueAt(obj, "productCategories"))) {
            auto & cObj = getObject(c);
            ProductCategory category{.categoryName = stringAt(cObj, "categoryName")};
            for (auto & l : getArray(valueAt(cObj, "productLines"))) {
                auto & lObj = getObject(l);
                category.productLines.push_back(ProductLine{
                    .targetOS = stringAt(lObj, "targetOS"),
                    .targetType = optionalStringAt(lObj, "targetType"),
                    .serverType = optionalStringListAt(lObj, "serverType"),
                    .releasesIndexUrl = resolveUrl(source, stringAt(lObj, "releasesIndexURL")),
                });
            }
            catalog.productCategories.push_back(std::move(category));
        }

        return catalog;
    });
}

L1Catalog L1Catalog::fetch(CachedFetcher & fetcher, const std::string & url)
{
    return fromJSON(fetchDocument(fetcher, url), url);
}

Strings L1Catalog::categoryNames() const
{
    Strings res;
    for (auto & c : productCategories)
        res.push_back(c.categoryName);
    return res;
}

const ProductCategory * L1Catalog::getProductCategory(std::string_view name) const
{
    for (auto & c : productCategories)
        if (c.categoryName == name)
            return &c;
    return nullptr;
}

const ProductLine & L1Catalog::selectProductLine(
    const std::optional<std::string> & categoryName, const std::optional<std::string> & targetOS) const
{
    if (!categoryName)
        throw UsageError("no product category specified; %s", showChoices(categoryNames()));

    auto category = getProductCategory(*categoryName);
    if (!category)
        throw UsageError("unknown product category '%s'; %s", *categoryName, showChoices(categoryNames()));

    if (!targetOS)
        throw UsageError("no target OS specified; %s", showChoices(category->targetOSes()));

    auto line = category->getProductLine(*targetOS);
    if (!line)
        throw UsageError(
            "unknown target OS '%s' for product category '%s'; %s",
            *targetOS,
            *categoryName,
            showChoices(category->targetOSes()));

    return *line;
}

/* L2 */

L2Catalog L2Catalog::fromJSON(const nlohmann::json & json, const std::string & source)
{
    return parseCatalog("release index", source, [&]() {
        auto & obj = getObject(json);

        L2Catalog catalog;
        catalog.source = source;

        if (auto * info = optionalValueAt(obj, "information"))
            catalog.title = optionalStringAt(getObject(*info), "title");

        for (auto & r : getArray(valueAt(obj, "releases"))) {
            auto & rObj = getObject(r);
            Release release{
                .title = stringAt(rObj, "title"),
                .productCategory = optionalStringAt(rObj, "productCategory"),
                .targetOS = optionalStringAt(rObj, "targetOS"),
                .releaseVersion = optionalStringAt(rObj, "releaseVersion"),
            };
            if (auto url = optionalStringAt(rObj, "compRepoURL"); !url.empty())
                release.compRepoUrl = resolveUrl(source, url);
            catalog.releases.push_back(std::move(release));
        }

        return catalog;
    });
}

L2Catalog L2Catalog::fetch(CachedFetcher & fetcher, const std::string & url)
{
    return fromJSON(fetchDocument(fetcher, url), url);
}

Strings L2Catalog::releaseTitles() const
{
    Strings res;
    for (auto & r : releases)
        res.push_back(r.title);
    return res;
}

const Release * L2Catalog::getRelease(std::string_view title) const
{
    for (auto & r : releases)
        if (r.title == title)
            return &r;
    return nullptr;
}

std::string L2Catalog::selectRelease(const std::optional<std::string> & title) const
{
    if (!title)
        throw UsageError("no release specified; %s", showChoices(releaseTitles()));

    auto release = getRelease(*title);
    if (!release)
        throw UsageError("unknown release '%s'; %s", *title, showChoices(releaseTitles()));

    if (!release->compRepoUrl)
        throw BadCatalog("release '%s' in '%s' has no component catalog", *title, source);

    return *release->compRepoUrl;
}

/* L3 */

static DownloadFile parseDownloadFile(const nlohmann::json & json, const std::string & compDirectory)
{
    auto & obj = getObject(json);
    return DownloadFile{
        .url = resolveUrl(compDirectory, stringAt(obj, "url")),
        .fileName = stringAt(obj, "fileName"),
        .size = getUnsigned(valueAt(obj, "size")),
        .checksum = stringAt(obj, "checksum"),
        .checksumType = stringAt(obj, "checksumType"),
    };
}

static Component parseComponent(const std::string & id, const nlohmann::json & json, const std::string & compDirectory)
{
    auto & obj = getObject(json);

    Component component{
        .id = id,
        .name = optionalStringAt(obj, "name"),
        .description = optionalStringAt(obj, "description"),
        .compType = optionalStringAt(obj, "compType"),
    };

    for (auto & v : getArray(valueAt(obj, "versions"))) {
        auto & vObj = getObject(v);
        ComponentVersion version{
            .version = stringAt(vObj, "version"),
            .operatingSystems = optionalStringListAt(vObj, "operatingSystems"),
            .targetIds = optionalStringListAt(vObj, "targetIds"),
        };
        if (auto * size = optionalValueAt(vObj, "installSizeMB"))
            version.installSizeMB = getNumber(*size);
        if (auto * files = optionalValueAt(vObj, "downloadFiles"))
            for (auto & f : getArray(*files))
                version.downloadFiles.push_back(parseDownloadFile(f, compDirectory));
        component.versions.push_back(std::move(version));
    }

    return component;
}

static Group parseGroup(const std::string & id, const nlohmann::json & json)
{
    auto & obj = getObject(json);

    Group group{
        .id = id,
        .name = optionalStringAt(obj, "name"),
        .installedOn = optionalStringAt(obj, "installedOn"),
        .description = optionalStringAt(obj, "description"),
    };

    for (auto & v : getArray(valueAt(obj, "versions"))) {
        auto & vObj = getObject(v);
        GroupVersion version{.version = stringAt(vObj, "version")};
        for (auto & c : getArray(valueAt(vObj, "components"))) {
            auto & cObj = getObject(c);
            version.components.emplace_back(stringAt(cObj, "id"), optionalStringAt(cObj, "version"));
        }
        group.versions.push_back(std::move(version));
    }

    return group;
}

L3Catalog L3Catalog::fromJSON(const nlohmann::json & json, const std::string & source)
{
    return parseCatalog("component catalog", source, [&]() {
        auto & obj = getObject(json);

        L3Catalog catalog;
        catalog.source = source;
        catalog.compDirectory = resolveUrl(source, stringAt(obj, "compDirectory"));

        for (auto & s : getArray(valueAt(obj, "sections"))) {
            auto & sObj = getObject(s);
            catalog.sections.push_back(Section{
                .id = stringAt(sObj, "id"),
                .name = optionalStringAt(sObj, "name"),
                .title = optionalStringAt(sObj, "title"),
                .groups = optionalStringListAt(sObj, "groups"),
            });
        }

        for (auto & [id, g] : getObject(valueAt(obj, "groups")))
            catalog.groups.emplace(id, parseGroup(id, g));

        for (auto & [id, c] : getObject(valueAt(obj, "components")))
            catalog.components.emplace(id, parseComponent(id, c, catalog.compDirectory));

        return catalog;
    });
}

L3Catalog L3Catalog::fetch(CachedFetcher & fetcher, const std::string & url)
{
    return fromJSON(fetchDocument(fetcher, url), url);
}

Strings L3Catalog::sectionIds() const
{
    Strings res;
    for (auto & s : sections)
        res.push_back(s.id);
    return res;
}

Strings L3Catalog::groupIds() const
{
    Strings res;
    for (auto & [id, _] : groups)
        res.push_back(id);
    return res;
}

Strings L3Catalog::componentIds() const
{
    Strings res;
    for (auto & [id, _] : components)
        res.push_back(id);
    return res;
}

const Section * L3Catalog::getSection(std::string_view id) const
{
    for (auto & s : sections)
        if (s.id == id)
            return &s;
    return nullptr;
}

const Group * L3Catalog::getGroup(std::string_view id) const
{
    auto i = groups.find(std::string(id));
    return i == groups.end() ? nullptr : &i->second;
}

const Component * L3Catalog::getComponent(std::string_view id) const
{
    auto i = components.find(std::string(id));
    return i == components.end() ? nullptr : &i->second;
}

StringSet L3Catalog::componentsForSection(std::string_view id) const
{
    auto section = getSection(id);
    if (!section)
        throw UsageError("unknown section '%s'; %s", id, showChoices(sectionIds()));

    StringSet res;
    for (auto & groupId : section->groups)
        res.merge(componentsForGroup(groupId));
    return res;
}

StringSet L3Catalog::componentsForGroup(std::string_view id) const
{
    auto group = getGroup(id);
    if (!group)
        throw UsageError("unknown group '%s'; %s", id, showChoices(groupIds()));

    StringSet res;
    if (group->versions.empty())
        return res;

    if (group->versions.size() > 1)
        warn("group '%s' has %d versions, selecting the first", id, group->versions.size());

    for (auto & [componentId, version] : group->versions.front().components)
        res.insert(componentId);
    return res;
}

} // namespace fetchcache
