#pragma once
///@file

#include "fetchcache/util/error.hh"
#include "fetchcache/util/types.hh"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <optional>
#include <vector>

namespace fetchcache {

class CachedFetcher;

/**
 * A catalog document or configuration file that doesn't have the
 * expected shape.
 */
MakeError(BadCatalog, Error);

/**
 * The configuration file of the package manager, pointing at the
 * top-level catalog.
 */
struct CatalogConfig
{
    std::string mainRepoUrl;
    std::string pidServer;
    std::string devZoneServer;

    static CatalogConfig fromJSON(const nlohmann::json & json);

    static CatalogConfig load(const Path & path);
};

/**
 * One target OS of a product category, pointing at its release index.
 */
struct ProductLine
{
    std::string targetOS;
    std::string targetType;
    Strings serverType;
    /**
     * Absolute URL of the L2 release index.
     */
    std::string releasesIndexUrl;
};

struct ProductCategory
{
    std::string categoryName;
    std::vector<ProductLine> productLines;

    Strings targetOSes() const;

    const ProductLine * getProductLine(std::string_view targetOS) const;
};

/**
 * The top-level (L1) catalog: product categories and their product
 * lines.
 */
struct L1Catalog
{
    std::string source;
    std::string title;
    std::string version;
    std::vector<ProductCategory> productCategories;

    static L1Catalog fromJSON(const nlohmann::json & json, const std::string & source);

    static L1Catalog fetch(CachedFetcher & fetcher, const std::string & url);

    Strings categoryNames() const;

    const ProductCategory * getProductCategory(std::string_view name) const;

    /**
     * Select a product line. Throws `UsageError` listing the valid
     * choices if either argument is missing or unknown.
     */
    const ProductLine &
    selectProductLine(const std::optional<std::string> & category, const std::optional<std::string> & targetOS) const;
};

/**
 * A release of a product line.
 */
struct Release
{
    std::string title;
    std::string productCategory;
    std::string targetOS;
    std::string releaseVersion;
    /**
     * Absolute URL of the L3 component catalog, if the release has one.
     */
    std::optional<std::string> compRepoUrl;
};

/**
 * The release index (L2) of a product line.
 */
struct L2Catalog
{
    std::string source;
    std::string title;
    std::vector<Release> releases;

    static L2Catalog fromJSON(const nlohmann::json & json, const std::string & source);

    static L2Catalog fetch(CachedFetcher & fetcher, const std::string & url);

    Strings releaseTitles() const;

    const Release * getRelease(std::string_view title) const;

    /**
     * Select a release and return the URL of its component catalog.
     * Throws `UsageError` listing the valid choices if `title` is
     * missing or unknown, and `BadCatalog` if the release has no
     * component catalog.
     */
    std::string selectRelease(const std::optional<std::string> & title) const;
};

/**
 * A file to download for a component, with its expected checksum.
 */
struct DownloadFile
{
    /**
     * Absolute URL.
     */
    std::string url;
    std::string fileName;
    uint64_t size = 0;
    std::string checksum;
    std::string checksumType;
};

struct ComponentVersion
{
    std::string version;
    Strings operatingSystems;
    double installSizeMB = 0;
    Strings targetIds;
    std::vector<DownloadFile> downloadFiles;
};

struct Component
{
    std::string id;
    std::string name;
    std::string description;
    std::string compType;
    std::vector<ComponentVersion> versions;
};

struct GroupVersion
{
    std::string version;
    /**
     * Component id and version pairs.
     */
    std::vector<std::pair<std::string, std::string>> components;
};

struct Group
{
    std::string id;
    std::string name;
    std::string installedOn;
    std::string description;
    std::vector<GroupVersion> versions;
};

struct Section
{
    std::string id;
    std::string name;
    std::string title;
    Strings groups;
};

/**
 * The component catalog (L3) of a release: sections made of groups
 * made of components, which carry the files to download.
 */
struct L3Catalog
{
    std::string source;
    /**
     * Absolute URL that download file URLs are relative to.
     */
    std::string compDirectory;
    std::vector<Section> sections;
    std::map<std::string, Group> groups;
    std::map<std::string, Component> components;

    static L3Catalog fromJSON(const nlohmann::json & json, const std::string & source);

    static L3Catalog fetch(CachedFetcher & fetcher, const std::string & url);

    Strings sectionIds() const;
    Strings groupIds() const;
    Strings componentIds() const;

    const Section * getSection(std::string_view id) const;
    const Group * getGroup(std::string_view id) const;
    const Component * getComponent(std::string_view id) const;

    /**
     * The components of the first version of every group in the
     * section. Throws `UsageError` if there is no such section.
     */
    StringSet componentsForSection(std::string_view id) const;

    /**
     * The components of the first version of the group. Throws
     * `UsageError` if there is no such group.
     */
    StringSet componentsForGroup(std::string_view id) const;
};

} // namespace fetchcache
