#pragma once
///@file

#include "fetchcache/cache/filetransfer.hh"

#include <deque>
#include <map>

namespace fetchcache::testing {

/**
 * A response served by `FakeFileTransfer`.
 */
struct FakeResponse
{
    unsigned int status = 200;
    Headers headers;
    std::string body;
};

/**
 * An in-process `FileTransfer` that serves queued responses and
 * records the requests it was given. URLs without queued responses
 * answer 404.
 */
class FakeFileTransfer : public FileTransfer
{
    std::map<std::string, std::deque<FakeResponse>> responses;

public:

    struct RecordedRequest
    {
        std::string uri;
        Headers headers;
        ActivityId parentAct;

        std::optional<std::string> header(std::string_view name) const
        {
            for (auto & [k, v] : headers)
                if (toLower(k) == toLower(std::string(name)))
                    return v;
            return std::nullopt;
        }
    };

    std::vector<RecordedRequest> requests;

    /**
     * If set, every request fails as if the connection was refused.
     */
    bool offline = false;

    void enqueue(const std::string & uri, FakeResponse response)
    {
        responses[uri].push_back(std::move(response));
    }

    FileTransferResult download(const FileTransferRequest & request, Sink & sink) override
    {
        requests.push_back({request.uri, request.headers, request.parentAct});

        if (offline)
            throw FileTransferError(
                Transient, std::nullopt, "unable to download '%s': Couldn't connect to server (7)", request.uri);

        FakeResponse response{.status = 404, .headers = {}, .body = "not found"};
        if (auto i = responses.find(request.uri); i != responses.end() && !i->second.empty()) {
            response = std::move(i->second.front());
            i->second.pop_front();
        }

        FileTransferResult result;
        result.status = response.status;
        result.statusMsg = response.status == 304 ? "Not Modified" : "";
        result.effectiveUri = request.uri;
        result.bodySize = response.body.size();
        for (auto & [name, value] : response.headers)
            result.headers.emplace_back(toLower(name), value);

        if (result.isSuccess())
            sink(response.body);
        else if (!response.body.empty())
            result.errorBody = response.body;

        return result;
    }
};

} // namespace fetchcache::testing
