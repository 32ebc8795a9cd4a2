#include <exception> // Needed by rapidcheck on Darwin
#include <rapidcheck.h>

#include "fetchcache/cache/tests/metadata.hh"

namespace rc {
using namespace fetchcache;

/* Up to the end of year 9999. */
static Gen<time_t> timestamps()
{
    return gen::inRange<time_t>(0, 253402300800);
}

static Gen<std::string> octets()
{
    return gen::container<std::string>(gen::arbitrary<char>());
}

static Gen<std::string> fieldNames()
{
    return gen::nonEmpty(
        gen::container<std::string>(gen::elementOf(std::string("abcdefghijklmnopqrstuvwxyz0123456789-_."))));
}

Gen<CacheControl> Arbitrary<CacheControl>::arbitrary()
{
    return gen::mapcat(
        gen::inRange<uint8_t>(0, std::variant_size_v<CacheControl::Raw>), [](uint8_t n) -> Gen<CacheControl> {
            switch (n) {
            case 0:
                return gen::just(CacheControl{CacheControl::NoStore{}});
            case 1:
                return gen::just(CacheControl{CacheControl::NoCache{}});
            case 2:
                return gen::map(timestamps(), [](time_t t) { return CacheControl{CacheControl::Expires{t}}; });
            default:
                return gen::just(CacheControl{CacheControl::MustRevalidate{}});
            }
        });
}

Gen<CacheMetadata> Arbitrary<CacheMetadata>::arbitrary()
{
    return gen::exec([]() {
        CacheMetadata md;
        md.source = *octets();
        md.timestamp = *timestamps();
        if (*gen::arbitrary<bool>())
            md.validators.etag = *octets();
        if (*gen::arbitrary<bool>())
            md.validators.lastModified = *octets();
        md.cacheControl = *gen::arbitrary<CacheControl>();
        md.cacheType = *gen::element(CacheType::Public, CacheType::Private);
        md.responseHeaders =
            *gen::container<std::map<std::string, Strings>>(fieldNames(), gen::container<Strings>(octets()));
        return md;
    });
}

} // namespace rc
