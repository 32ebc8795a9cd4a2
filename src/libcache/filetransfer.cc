#include "fetchcache/cache/filetransfer.hh"
#include "fetchcache/util/config-global.hh"
#include "fetchcache/util/util.hh"

#include <curl/curl.h>

#include <mutex>
#include <regex>

namespace fetchcache {

FileTransferSettings fileTransferSettings;

static GlobalConfig::Register rFileTransferSettings(&fileTransferSettings);

std::optional<std::string> FileTransferResult::header(std::string_view name) const
{
    for (auto & [k, v] : headers)
        if (k == name)
            return v;
    return std::nullopt;
}

Strings FileTransferResult::headerValues(std::string_view name) const
{
    Strings res;
    for (auto & [k, v] : headers)
        if (k == name)
            res.push_back(v);
    return res;
}

FileTransfer::Error FileTransfer::classifyStatus(unsigned int httpStatus)
{
    if (httpStatus == 404 || httpStatus == 410)
        // The file is definitely not there
        return NotFound;
    if (httpStatus == 401 || httpStatus == 403 || httpStatus == 407)
        return Forbidden;
    // 408 and 429 mean the server wants us to try again later.
    if (httpStatus == 408 || httpStatus == 429)
        return Transient;
    // Most 5xx are server hiccups, except for a handful:
    //   * 501 not implemented
    //   * 505 http version not supported
    //   * 511 we're behind a captive portal
    if (httpStatus >= 500 && httpStatus != 501 && httpStatus != 505 && httpStatus != 511)
        return Transient;
    return Misc;
}

HttpStatusError::HttpStatusError(const std::string & uri, const FileTransferResult & result)
    : FileTransferError(
          FileTransfer::classifyStatus(result.status),
          result.errorBody,
          "unable to download '%s': HTTP error %d ('%s')",
          uri,
          result.status,
          result.statusMsg)
    , status(result.status)
{
}

struct curlFileTransfer : public FileTransfer
{
    CURL * req = nullptr;

    curlFileTransfer()
    {
        static std::once_flag globalInit;
        std::call_once(globalInit, []() {
            if (auto code = curl_global_init(CURL_GLOBAL_ALL); code != CURLE_OK)
                throw fetchcache::Error("unable to initialise curl: %s", curl_easy_strerror(code));
        });

        req = curl_easy_init();
        if (!req)
            throw fetchcache::Error("unable to create a curl handle");
    }

    ~curlFileTransfer()
    {
        curl_easy_cleanup(req);
    }

    /**
     * State of one attempt of one request.
     */
    struct TransferItem
    {
        CURL * req;
        const FileTransferRequest & request;
        Sink & sink;
        FileTransferResult result;
        Activity act;

        struct curl_slist * requestHeaders = nullptr;

        std::optional<StringSink> errorSink;

        std::exception_ptr writeException;

        uint64_t writtenToSink = 0;

        TransferItem(CURL * req, const FileTransferRequest & request, Sink & sink)
            : req(req)
            , request(request)
            , sink(sink)
            , act(*logger,
                  lvlTalkative,
                  actFileTransfer,
                  fmt("downloading '%s'", request.uri),
                  {request.uri},
                  request.parentAct)
        {
            for (auto & [name, value] : request.headers)
                requestHeaders = curl_slist_append(requestHeaders, (name + ": " + value).c_str());
        }

        ~TransferItem()
        {
            if (requestHeaders)
                curl_slist_free_all(requestHeaders);
        }

        /* Get the HTTP status code, or 0 for other protocols. */
        long getHTTPStatus()
        {
            long httpStatus = 0;
            char * scheme = nullptr;
            curl_easy_getinfo(req, CURLINFO_SCHEME, &scheme);
            if (scheme && (toLower(scheme) == "http" || toLower(scheme) == "https"))
                curl_easy_getinfo(req, CURLINFO_RESPONSE_CODE, &httpStatus);
            return httpStatus;
        }

        bool successfulStatus()
        {
            auto httpStatus = getHTTPStatus();
            return httpStatus == 0 || (httpStatus >= 200 && httpStatus < 300);
        }

        size_t writeCallback(void * contents, size_t size, size_t nmemb)
        {
            size_t realSize = size * nmemb;
            std::string_view data((char *) contents, realSize);
            result.bodySize += realSize;

            try {
                /* Only write data to the sink if this is a successful
                   response. Keep other bodies around to improve error
                   messages. */
                if (successfulStatus()) {
                    sink(data);
                    writtenToSink += realSize;
                } else {
                    if (!errorSink)
                        errorSink = StringSink{};
                    (*errorSink)(data);
                }
                return realSize;
            } catch (std::exception &) {
                writeException = std::current_exception();
                return 0;
            }
        }

        static size_t writeCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
        {
            return ((TransferItem *) userp)->writeCallback(contents, size, nmemb);
        }

        size_t headerCallback(void * contents, size_t size, size_t nmemb)
        {
            size_t realSize = size * nmemb;
            std::string line((char *) contents, realSize);
            vomit("got header for '%s': %s", request.uri, trim(line));

            static std::regex statusLine("HTTP/[^ ]+ +([0-9]+)(.*)", std::regex::extended | std::regex::icase);
            if (std::smatch match; std::regex_match(line, match, statusLine)) {
                /* A new response starts (e.g. after a redirect), so
                   forget the headers of the previous one. */
                result.headers.clear();
                result.statusMsg = trim(match.str(2));
            } else {
                auto i = line.find(':');
                if (i != std::string::npos)
                    result.headers.emplace_back(toLower(trim(line.substr(0, i))), trim(line.substr(i + 1)));
            }
            return realSize;
        }

        static size_t headerCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
        {
            return ((TransferItem *) userp)->headerCallback(contents, size, nmemb);
        }

        int progressCallback(curl_off_t dltotal, curl_off_t dlnow)
        {
            act.progress(dlnow, dltotal);
            return 0;
        }

        static int progressCallbackWrapper(
            void * userp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
        {
            return ((TransferItem *) userp)->progressCallback(dltotal, dlnow);
        }

        static int debugCallback(CURL * handle, curl_infotype type, char * data, size_t size, void * userptr)
        {
            if (type == CURLINFO_TEXT)
                vomit("curl: %s", chomp(std::string(data, size)));
            return 0;
        }

        void init()
        {
            curl_easy_reset(req);

            if (verbosity >= lvlVomit) {
                curl_easy_setopt(req, CURLOPT_VERBOSE, 1);
                curl_easy_setopt(req, CURLOPT_DEBUGFUNCTION, TransferItem::debugCallback);
            }

            curl_easy_setopt(req, CURLOPT_URL, request.uri.c_str());
            curl_easy_setopt(req, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(req, CURLOPT_MAXREDIRS, 10);
            curl_easy_setopt(req, CURLOPT_NOSIGNAL, 1);
            curl_easy_setopt(
                req,
                CURLOPT_USERAGENT,
                ("curl/" LIBCURL_VERSION " fetchcache/" FETCHCACHE_VERSION
                 + (fileTransferSettings.userAgentSuffix != "" ? " " + fileTransferSettings.userAgentSuffix.get()
                                                               : ""))
                    .c_str());
            if (fileTransferSettings.enableHttp2)
                curl_easy_setopt(req, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
            else
                curl_easy_setopt(req, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
            curl_easy_setopt(req, CURLOPT_WRITEFUNCTION, TransferItem::writeCallbackWrapper);
            curl_easy_setopt(req, CURLOPT_WRITEDATA, this);
            curl_easy_setopt(req, CURLOPT_HEADERFUNCTION, TransferItem::headerCallbackWrapper);
            curl_easy_setopt(req, CURLOPT_HEADERDATA, this);

            curl_easy_setopt(req, CURLOPT_XFERINFOFUNCTION, progressCallbackWrapper);
            curl_easy_setopt(req, CURLOPT_XFERINFODATA, this);
            curl_easy_setopt(req, CURLOPT_NOPROGRESS, 0);

            curl_easy_setopt(req, CURLOPT_HTTPHEADER, requestHeaders);

            curl_easy_setopt(req, CURLOPT_CONNECTTIMEOUT, (long) fileTransferSettings.connectTimeout.get());

            curl_easy_setopt(req, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(req, CURLOPT_LOW_SPEED_TIME, (long) fileTransferSettings.stalledDownloadTimeout.get());

            curl_easy_setopt(req, CURLOPT_TIMEOUT, (long) fileTransferSettings.requestTimeout.get());
        }

        /**
         * Run the request to completion. Throws `FileTransferError` if
         * no response was received.
         */
        void perform()
        {
            init();

            auto code = curl_easy_perform(req);

            auto httpStatus = getHTTPStatus();

            char * effectiveUriCStr = nullptr;
            curl_easy_getinfo(req, CURLINFO_EFFECTIVE_URL, &effectiveUriCStr);
            if (effectiveUriCStr)
                result.effectiveUri = effectiveUriCStr;

            debug(
                "finished %s of '%s'; curl status = %d, HTTP status = %d, body = %d bytes",
                request.verb(),
                request.uri,
                code,
                httpStatus,
                result.bodySize);

            if (writeException)
                std::rethrow_exception(writeException);

            result.status = httpStatus;
            if (errorSink)
                result.errorBody = std::move(errorSink->s);

            if (code == CURLE_OK) {
                act.progress(result.bodySize, result.bodySize);
                return;
            }

            Error err = Transient;

            switch (code) {
            case CURLE_FILE_COULDNT_READ_FILE:
                err = NotFound;
                break;
            case CURLE_FAILED_INIT:
            case CURLE_URL_MALFORMAT:
            case CURLE_NOT_BUILT_IN:
            case CURLE_REMOTE_ACCESS_DENIED:
            case CURLE_FUNCTION_NOT_FOUND:
            case CURLE_ABORTED_BY_CALLBACK:
            case CURLE_BAD_FUNCTION_ARGUMENT:
            case CURLE_INTERFACE_FAILED:
            case CURLE_UNKNOWN_OPTION:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_TOO_MANY_REDIRECTS:
            case CURLE_WRITE_ERROR:
            case CURLE_UNSUPPORTED_PROTOCOL:
                err = Misc;
                break;
            default: // Shut up warnings
                break;
            }

            throw FileTransferError(
                err,
                result.errorBody,
                "unable to %s '%s': %s (%d)",
                request.verb(),
                request.uri,
                curl_easy_strerror(code),
                code);
        }
    };

    FileTransferResult download(const FileTransferRequest & request, Sink & sink) override
    {
        TransferItem item(req, request, sink);
        item.perform();
        return std::move(item.result);
    }
};

std::unique_ptr<FileTransfer> makeFileTransfer()
{
    return std::make_unique<curlFileTransfer>();
}

} // namespace fetchcache
