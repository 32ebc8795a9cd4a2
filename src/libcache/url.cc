#include "fetchcache/cache/url.hh"
#include "fetchcache/util/finally.hh"

#include <curl/curl.h>

namespace fetchcache {

static std::string getUrl(CURLU * h, const std::string & url)
{
    char * s = nullptr;
    if (auto rc = curl_url_get(h, CURLUPART_URL, &s, 0); rc != CURLUE_OK)
        throw BadURL("'%s' is not a valid URL: %s", url, curl_url_strerror(rc));
    Finally freeString([&]() { curl_free(s); });
    return s;
}

static CURLU * newHandle()
{
    auto h = curl_url();
    if (!h)
        throw Error("out of memory parsing URL");
    return h;
}

std::string normaliseUrl(const std::string & url)
{
    auto h = newHandle();
    Finally cleanup([&]() { curl_url_cleanup(h); });

    if (auto rc = curl_url_set(h, CURLUPART_URL, url.c_str(), 0); rc != CURLUE_OK)
        throw BadURL("'%s' is not a valid URL: %s", url, curl_url_strerror(rc));

    return getUrl(h, url);
}

std::string resolveUrl(const std::string & base, const std::string & ref)
{
    auto h = newHandle();
    Finally cleanup([&]() { curl_url_cleanup(h); });

    if (auto rc = curl_url_set(h, CURLUPART_URL, base.c_str(), 0); rc != CURLUE_OK)
        throw BadURL("'%s' is not a valid base URL: %s", base, curl_url_strerror(rc));

    /* Setting a URL on a handle that already holds one resolves it as
       a relative reference. */
    if (auto rc = curl_url_set(h, CURLUPART_URL, ref.c_str(), 0); rc != CURLUE_OK)
        throw BadURL("cannot resolve '%s' against '%s': %s", ref, base, curl_url_strerror(rc));

    return getUrl(h, ref);
}

} // namespace fetchcache
