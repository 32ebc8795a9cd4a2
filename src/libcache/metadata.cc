#include "fetchcache/cache/metadata.hh"
#include "fetchcache/util/charset.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/json-utils.hh"
#include "fetchcache/util/util.hh"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstring>
#include <time.h>

namespace fetchcache {

static const unsigned int metadataVersion = 1;

std::string printTimestamp(time_t t)
{
    struct tm tm;
    if (!gmtime_r(&t, &tm))
        throw Error("cannot convert timestamp %d", t);
    char buf[64];
    auto n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

time_t parseTimestamp(std::string_view s)
{
    std::string str(s);
    struct tm tm;
    memset(&tm, 0, sizeof(tm));
    auto end = strptime(str.c_str(), "%Y-%m-%dT%H:%M:%SZ", &tm);
    if (!end || *end != 0)
        throw Error("invalid timestamp '%s'", s);
    return timegm(&tm);
}

/**
 * Whether `s` is a field name (an RFC 9110 token).
 */
static bool isFieldName(std::string_view s)
{
    static const std::string_view tchar = "!#$%&'*+-.^_`|~";
    if (s.empty())
        return false;
    for (auto c : s)
        if (!isalnum((unsigned char) c) && tchar.find(c) == std::string_view::npos)
            return false;
    return true;
}

CacheMetadata CacheMetadata::fromResponse(const std::string & source, const Headers & headers, time_t now)
{
    CacheMetadata md;
    md.source = source;
    md.timestamp = now;

    for (auto & [name, value] : headers) {
        if (!isFieldName(name)) {
            debug("ignoring response header with an invalid name from '%s'", source);
            continue;
        }
        md.responseHeaders[toLower(name)].push_back(value);
    }

    md.validators.etag = md.header("etag");
    md.validators.lastModified = md.header("last-modified");

    Strings cacheControl;
    if (auto i = md.responseHeaders.find("cache-control"); i != md.responseHeaders.end())
        cacheControl = i->second;
    md.cacheControl = CacheControl::parse(cacheControl, now);
    md.cacheType = parseCacheType(cacheControl);

    return md;
}

std::optional<std::string> CacheMetadata::header(std::string_view name) const
{
    auto i = responseHeaders.find(std::string(name));
    if (i == responseHeaders.end() || i->second.empty())
        return std::nullopt;
    return i->second.front();
}

static bool isJSONString(const std::string & s)
{
    try {
        nlohmann::json(s).dump();
        return true;
    } catch (nlohmann::json::type_error &) {
        return false;
    }
}

/* Header values are octets (RFC 9110 section 5.5) and need not be
   UTF-8. Those that are not are stored as `{ "latin1": "..." }`, which
   maps each byte to one character and back. */
static nlohmann::json octetsToJSON(const std::string & s)
{
    if (isJSONString(s))
        return s;
    return nlohmann::json{{"latin1", latin1ToUtf8(s)}};
}

static std::string octetsFromJSON(const nlohmann::json & json)
{
    if (json.is_object())
        return utf8ToLatin1(getString(valueAt(getObject(json), "latin1")));
    return getString(json);
}

static nlohmann::json optionalToJSON(const std::optional<std::string> & s)
{
    return s ? octetsToJSON(*s) : nlohmann::json(nullptr);
}

nlohmann::json CacheMetadata::toJSON() const
{
    nlohmann::json cc;
    cc["type"] = std::string(cacheControl.typeName());
    if (auto expires = std::get_if<CacheControl::Expires>(&cacheControl.raw))
        cc["expires"] = printTimestamp(expires->at);

    auto headers = nlohmann::json::object();
    for (auto & [name, values] : responseHeaders) {
        auto & list = headers[name] = nlohmann::json::array();
        for (auto & value : values)
            list.push_back(octetsToJSON(value));
    }

    return nlohmann::json{
        {"version", metadataVersion},
        {"source", octetsToJSON(source)},
        {"timestamp", printTimestamp(timestamp)},
        {"etag", optionalToJSON(validators.etag)},
        {"last_modified", optionalToJSON(validators.lastModified)},
        {"cache_control", std::move(cc)},
        {"cache_type", std::string(printCacheType(cacheType))},
        {"response_headers", std::move(headers)},
    };
}

static std::optional<std::string> optionalOctetsAt(const nlohmann::json::object_t & obj, std::string_view key)
{
    auto * v = optionalValueAt(obj, key);
    if (!v)
        return std::nullopt;
    if (auto * s = getNullable(*v))
        return octetsFromJSON(*s);
    return std::nullopt;
}

static CacheControl cacheControlFromJSON(const nlohmann::json & json)
{
    auto & obj = getObject(json);
    auto & type = getString(valueAt(obj, "type"));
    if (type == "no-store")
        return CacheControl{CacheControl::NoStore{}};
    if (type == "no-cache")
        return CacheControl{CacheControl::NoCache{}};
    if (type == "must-revalidate")
        return CacheControl{CacheControl::MustRevalidate{}};
    if (type == "expires")
        return CacheControl{CacheControl::Expires{parseTimestamp(getString(valueAt(obj, "expires")))}};
    throw Error("unknown cache control type '%s'", type);
}

CacheMetadata CacheMetadata::fromJSON(const nlohmann::json & json)
{
    try {
        auto & obj = getObject(json);

        auto version = getUnsigned(valueAt(obj, "version"));
        if (version != metadataVersion)
            throw Error("unsupported cache metadata version %d", version);

        CacheMetadata md;
        md.source = octetsFromJSON(valueAt(obj, "source"));
        md.timestamp = parseTimestamp(getString(valueAt(obj, "timestamp")));
        md.validators.etag = optionalOctetsAt(obj, "etag");
        md.validators.lastModified = optionalOctetsAt(obj, "last_modified");

        if (auto * cc = optionalValueAt(obj, "cache_control"))
            md.cacheControl = cacheControlFromJSON(*cc);

        if (auto * ct = optionalValueAt(obj, "cache_type")) {
            auto & s = getString(*ct);
            auto type = parseCacheTypeOpt(s);
            if (!type)
                throw Error("unknown cache type '%s'", s);
            md.cacheType = *type;
        }

        if (auto * headers = optionalValueAt(obj, "response_headers"))
            for (auto & [name, values] : getObject(*headers)) {
                auto & list = md.responseHeaders[name];
                for (auto & value : getArray(values))
                    list.push_back(octetsFromJSON(value));
            }

        return md;
    } catch (Error & e) {
        throw BadCacheMetadata("invalid cache metadata: %s", Uncolored(e.message()));
    }
}

MetadataStore::MetadataStore(const Path & cacheRoot)
    : httpDir(canonPath(absPath(cacheRoot) + "/http"))
{
}

Path MetadataStore::entryDir(const CacheKey & key) const
{
    return httpDir + "/" + key.to_string();
}

Path MetadataStore::dataPath(const CacheKey & key) const
{
    return entryDir(key) + "/data";
}

Path MetadataStore::metadataPath(const CacheKey & key) const
{
    return entryDir(key) + "/metadata";
}

Path MetadataStore::lockPath(const CacheKey & key) const
{
    return entryDir(key) + "/lock";
}

std::optional<CacheMetadata> MetadataStore::load(const CacheKey & key) const
{
    auto path = metadataPath(key);

    if (!pathExists(path))
        return std::nullopt;

    debug("reading cache metadata from '%s'", path);

    auto contents = readFile(path);

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(contents);
    } catch (nlohmann::json::parse_error & e) {
        throw BadCacheMetadata("cache metadata '%s' is not valid JSON: %s", path, e.what());
    }

    try {
        return CacheMetadata::fromJSON(json);
    } catch (BadCacheMetadata & e) {
        e.addTrace("while reading cache metadata '%s'", path);
        throw;
    }
}

Path MetadataStore::stage(const CacheKey & key, const CacheMetadata & metadata) const
{
    auto contents = metadata.toJSON().dump(2) + "\n";

    createDirs(entryDir(key));

    auto tmp = makeTempPath(metadataPath(key));
    AutoDelete delTmp(tmp, false);
    writeFile(tmp, contents, 0666, FsSync::Yes);
    delTmp.cancel();
    return tmp;
}

void MetadataStore::commit(const CacheKey & key, const Path & staged) const
{
    auto path = metadataPath(key);
    debug("writing cache metadata to '%s'", path);
    renameFile(staged, path);
}

void MetadataStore::save(const CacheKey & key, const CacheMetadata & metadata) const
{
    auto staged = stage(key, metadata);
    AutoDelete delStaged(staged, false);
    commit(key, staged);
    delStaged.cancel();
}

} // namespace fetchcache
