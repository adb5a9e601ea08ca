#pragma once

#include "net/http_client.hpp"

namespace cursorup {

// libcurl easy-interface client. One handle per request; redirects followed.
class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient();

    Outcome<HttpResponse> Get(const HttpRequest& req) override;
    Result Download(const DownloadRequest& req,
                    IWriter& sink,
                    const DownloadProgressFn& on_progress) override;

    static std::string BuildUrl(const std::string& base,
                                const std::vector<std::pair<std::string, std::string>>& query);
};

} // namespace cursorup
