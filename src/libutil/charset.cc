#include "fetchcache/util/charset.hh"
#include "fetchcache/util/finally.hh"
#include "fetchcache/util/util.hh"

#include <cerrno>

#include <iconv.h>

namespace fetchcache {

std::optional<std::string> getCharsetParam(std::string_view contentType)
{
    auto params = tokenizeString<std::vector<std::string>>(contentType, ";");
    if (params.empty())
        return std::nullopt;

    /* The first token is the media type itself. */
    for (auto i = std::next(params.begin()); i != params.end(); ++i) {
        auto eq = i->find('=');
        if (eq == std::string::npos)
            continue;
        if (toLower(trim(std::string_view(*i).substr(0, eq))) != "charset")
            continue;
        auto value = trim(std::string_view(*i).substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);
        if (value.empty())
            return std::nullopt;
        return value;
    }

    return std::nullopt;
}

/* iconv() takes a non-const input pointer for historical reasons. */
static size_t deconst_iconv(iconv_t cd, const char ** inbuf, size_t * inbytesleft, char ** outbuf, size_t * outbytesleft)
{
    char ** inbuf2 = const_cast<char **>(inbuf);
    return iconv(cd, inbuf2, inbytesleft, outbuf, outbytesleft);
}

/**
 * Convert `data` from charset `from` to charset `to`. Names in error
 * messages refer to `from`; `to` is always a charset the C library
 * knows.
 */
static std::string convert(std::string_view data, const std::string & from, const std::string & to)
{
    iconv_t cd = iconv_open(to.c_str(), from.c_str());
    if (cd == (iconv_t) -1) {
        if (errno == EINVAL)
            throw UnknownCharset("unknown character set '%s'", from);
        throw SysError("opening converter from '%s'", from);
    }
    Finally closeConverter([&]() { iconv_close(cd); });

    std::string res;
    res.resize(data.size() + 16);
    size_t written = 0;

    const char * src = data.data();
    size_t srcLeft = data.size();

    while (true) {
        char * dest = res.data() + written;
        size_t destLeft = res.size() - written;

        /* Once the input is consumed, a call without input writes the
           sequence that returns a stateful encoding to its initial
           state. */
        bool flushing = srcLeft == 0;

        size_t ret = flushing ? iconv(cd, nullptr, nullptr, &dest, &destLeft)
                              : deconst_iconv(cd, &src, &srcLeft, &dest, &destLeft);
        written = dest - res.data();

        if (ret != (size_t) -1) {
            if (flushing)
                break;
            continue;
        }

        switch (errno) {
        case EILSEQ:
            throw DecodeError("invalid %s byte sequence at offset %d", from, data.size() - srcLeft);

        case EINVAL:
            throw DecodeError("truncated %s byte sequence at end of input", from);

        case E2BIG:
            res.resize(res.size() * 2);
            break;

        default:
            throw SysError("converting from '%s'", from);
        }
    }

    res.resize(written);
    return res;
}

std::string decodeToUtf8(std::string_view data, const std::string & charset)
{
    return convert(data, charset, "UTF-8");
}

std::string checkUtf8(std::string_view data)
{
    return decodeToUtf8(data, "UTF-8");
}

std::string latin1ToUtf8(std::string_view data)
{
    return decodeToUtf8(data, "ISO-8859-1");
}

std::string utf8ToLatin1(std::string_view data)
{
    try {
        return convert(data, "UTF-8", "ISO-8859-1");
    } catch (DecodeError & e) {
        throw DecodeError("cannot represent UTF-8 text as ISO-8859-1: %s", Uncolored(e.message()));
    }
}

} // namespace fetchcache
