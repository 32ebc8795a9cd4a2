#include "fetchcache/cache/cache-control.hh"
#include "fetchcache/util/util.hh"
#include "fetchcache/util/strings.hh"

#include <limits>

namespace fetchcache {

/**
 * The largest `max-age` honoured (RFC 9111 section 1.2.2). Larger
 * values, including ones too large to represent, are treated as this.
 */
static const int64_t maxDeltaSeconds = 2147483648;

/**
 * Parse a delta-seconds value. Returns `std::nullopt` if `s` is not a
 * non-empty string of digits.
 */
static std::optional<int64_t> parseDeltaSeconds(std::string_view s)
{
    if (s.empty() || s.find_first_not_of("0123456789") != std::string_view::npos)
        return std::nullopt;
    auto n = string2Int<int64_t>(s);
    if (!n || *n > maxDeltaSeconds)
        return maxDeltaSeconds;
    return n;
}

static time_t addSeconds(time_t t, int64_t seconds)
{
    if (t > std::numeric_limits<time_t>::max() - seconds)
        return std::numeric_limits<time_t>::max();
    return t + seconds;
}

/**
 * Split the header values into lower-cased directive names and their
 * (unquoted) arguments.
 */
static std::vector<std::pair<std::string, std::optional<std::string>>> parseDirectives(const Strings & headerValues)
{
    std::vector<std::pair<std::string, std::optional<std::string>>> res;

    for (auto & value : headerValues) {
        for (auto & token : tokenizeString<Strings>(value, ",")) {
            auto directive = trim(token);
            if (directive.empty())
                continue;
            auto eq = directive.find('=');
            if (eq == std::string::npos) {
                res.emplace_back(toLower(directive), std::nullopt);
                continue;
            }
            auto arg = trim(directive.substr(eq + 1));
            if (arg.size() >= 2 && arg.front() == '"' && arg.back() == '"')
                arg = arg.substr(1, arg.size() - 2);
            res.emplace_back(toLower(trim(directive.substr(0, eq))), arg);
        }
    }

    return res;
}

CacheControl CacheControl::parse(const Strings & headerValues, time_t now)
{
    bool noStore = false, noCache = false;
    std::optional<time_t> expires;

    for (auto & [name, arg] : parseDirectives(headerValues)) {
        if (name == "no-store")
            noStore = true;
        else if (name == "no-cache")
            noCache = true;
        else if (name == "max-age") {
            auto seconds = arg ? parseDeltaSeconds(*arg) : std::nullopt;
            if (seconds) {
                if (!expires)
                    expires = addSeconds(now, *seconds);
            } else
                debug("ignoring malformed Cache-Control directive 'max-age=%s'", arg.value_or(""));
        } else if (name == "must-revalidate" || name == "public" || name == "private")
            /* `must-revalidate` is the default; the cache type is
               determined by parseCacheType(). */
            ;
        else
            debug("ignoring unsupported Cache-Control directive '%s'", name);
    }

    if (noStore)
        return CacheControl{NoStore{}};
    if (noCache)
        return CacheControl{NoCache{}};
    if (expires)
        return CacheControl{Expires{*expires}};
    return CacheControl{MustRevalidate{}};
}

std::string_view CacheControl::typeName() const
{
    return std::visit(
        overloaded{
            [](const NoStore &) -> std::string_view { return "no-store"; },
            [](const NoCache &) -> std::string_view { return "no-cache"; },
            [](const Expires &) -> std::string_view { return "expires"; },
            [](const MustRevalidate &) -> std::string_view { return "must-revalidate"; },
        },
        raw);
}

CacheType parseCacheType(const Strings & headerValues)
{
    for (auto & [name, arg] : parseDirectives(headerValues))
        if (name == "public")
            return CacheType::Public;
    return CacheType::Private;
}

std::string_view printCacheType(CacheType type)
{
    switch (type) {
    case CacheType::Public:
        return "public";
    case CacheType::Private:
        return "private";
    }
    panic("invalid cache type");
}

std::optional<CacheType> parseCacheTypeOpt(std::string_view s)
{
    if (s == "public")
        return CacheType::Public;
    if (s == "private")
        return CacheType::Private;
    return std::nullopt;
}

Validators evaluateValidators(const CacheControl & policy, const Validators & stored, time_t now)
{
    return std::visit(
        overloaded{
            [&](const CacheControl::NoStore &) { return Validators{}; },
            [&](const CacheControl::NoCache &) { return stored; },
            [&](const CacheControl::Expires & e) { return e.at > now ? Validators{} : stored; },
            [&](const CacheControl::MustRevalidate &) { return stored; },
        },
        policy.raw);
}

} // namespace fetchcache
