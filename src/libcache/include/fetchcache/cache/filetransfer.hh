#pragma once
///@file

#include <memory>
#include <optional>
#include <string>

#include "fetchcache/util/logging.hh"
#include "fetchcache/util/types.hh"
#include "fetchcache/util/configuration.hh"
#include "fetchcache/util/serialise.hh"
#include "fetchcache/util/util.hh"

namespace fetchcache {

struct FileTransferSettings : Config
{
    Setting<bool> enableHttp2{this, true, "http2", "Whether to enable HTTP/2 support."};

    Setting<std::string> userAgentSuffix{
        this, "", "user-agent-suffix", "String appended to the user agent in HTTP requests."};

    Setting<unsigned long> connectTimeout{
        this,
        15,
        "connect-timeout",
        R"(
          The timeout (in seconds) for establishing connections. It
          corresponds to `curl`'s `--connect-timeout` option. A value of
          0 means no limit.
        )"};

    Setting<unsigned long> stalledDownloadTimeout{
        this,
        300,
        "stalled-download-timeout",
        R"(
          The timeout (in seconds) for receiving data from servers
          during download. Downloads that stay idle for this long are
          cancelled.
        )"};

    Setting<unsigned long> requestTimeout{
        this,
        0,
        "request-timeout",
        R"(
          The maximum time (in seconds) a whole request may take,
          including the transfer of the body. A value of 0 means no
          limit.
        )"};
};

extern FileTransferSettings fileTransferSettings;

struct FileTransferRequest
{
    std::string uri;
    Headers headers;
    ActivityId parentAct;

    FileTransferRequest(std::string_view uri)
        : uri(uri)
        , parentAct(getCurActivity())
    {
    }

    std::string verb() const
    {
        return "download";
    }
};

/**
 * The outcome of a completed HTTP exchange. Any status the server sent
 * is reported here; only transport failures raise `FileTransferError`.
 */
struct FileTransferResult
{
    /**
     * The HTTP status of the final response after redirects, or 0 for
     * non-HTTP protocols.
     */
    unsigned int status = 0;

    /**
     * The reason phrase of the status line.
     */
    std::string statusMsg;

    /**
     * Headers of the final response, with lower-cased names, in the
     * order they were received.
     */
    Headers headers;

    /**
     * The effective URL after following redirects.
     */
    std::string effectiveUri;

    /**
     * Number of body bytes received.
     */
    uint64_t bodySize = 0;

    /**
     * The body of a non-successful response, kept for error messages.
     */
    std::optional<std::string> errorBody;

    /**
     * Whether the body is the requested data: any 2xx, or a transfer
     * over a protocol without status codes.
     */
    bool isSuccess() const
    {
        return status == 0 || (status >= 200 && status < 300);
    }

    /**
     * @return the first value of the header `name` (lower case).
     */
    std::optional<std::string> header(std::string_view name) const;

    /**
     * @return all values of the header `name` (lower case), in order.
     */
    Strings headerValues(std::string_view name) const;
};

struct FileTransfer
{
    virtual ~FileTransfer() {}

    /**
     * Perform a blocking GET. The body of a 2xx response is written to
     * `sink`; other bodies are kept in `FileTransferResult::errorBody`.
     * Failures are not retried.
     */
    virtual FileTransferResult download(const FileTransferRequest & request, Sink & sink) = 0;

    enum Error { NotFound, Forbidden, Misc, Transient };

    /**
     * Classify an HTTP status for error reporting.
     */
    static Error classifyStatus(unsigned int httpStatus);
};

/**
 * Create a transfer object backed by a single reusable curl handle, so
 * consecutive requests to the same host share a connection.
 */
std::unique_ptr<FileTransfer> makeFileTransfer();

class FileTransferError : public Error
{
public:
    FileTransfer::Error error;
    /// intentionally optional
    std::optional<std::string> response;

    template<typename... Args>
    FileTransferError(FileTransfer::Error error, std::optional<std::string> response, const Args &... args)
        : Error(args...)
        , error(error)
        , response(response)
    {
        const auto hf = HintFmt(args...);
        // Only short bodies are shown.
        if (response && !response->empty() && response->size() < 1024 && error != FileTransfer::NotFound)
            err.msg = HintFmt("%1%\n\nresponse body:\n\n%2%", Uncolored(hf.str()), chomp(*response));
        else
            err.msg = hf;
    }
};

/**
 * The server answered with a status that is neither 2xx nor an
 * expected 304.
 */
class HttpStatusError : public FileTransferError
{
public:
    unsigned int status;

    HttpStatusError(const std::string & uri, const FileTransferResult & result);
};

} // namespace fetchcache
