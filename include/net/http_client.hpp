#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cursorup {

struct HttpRequest {
    std::string url;
    // Appended to the URL as an escaped query string, in order.
    std::vector<std::pair<std::string, std::string>> query;
    std::map<std::string, std::string> headers;
    std::uint32_t timeout_sec = 15;
    std::uint32_t connect_timeout_sec = 15;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string effective_url;
};

struct DownloadRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::uint32_t connect_timeout_sec = 15;
    // Abort when less than 1 KiB/s arrives for this many seconds; 0 disables.
    std::uint32_t stall_timeout_sec = 60;
};

// done, total (0 when the server did not declare a length). Returning false
// aborts the transfer.
using DownloadProgressFn = std::function<bool(std::uint64_t, std::uint64_t)>;

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Non-2xx responses, DNS/connect failures and timeouts fail with NetworkError.
    virtual Outcome<HttpResponse> Get(const HttpRequest& req) = 0;

    // Streams the body into `sink`. Transport failure, non-2xx status, sink
    // write failure or a false return from `on_progress` fail the download.
    virtual Result Download(const DownloadRequest& req,
                            IWriter& sink,
                            const DownloadProgressFn& on_progress) = 0;
};

} // namespace cursorup
