#pragma once

#include "net/http_client.hpp"
#include "util/result.hpp"
#include "util/updater_config.hpp"

#include <string>

namespace cursorup {

struct RemoteRelease {
    std::string download_url;
    // First x.y.z found in download_url, or kUnknownVersion.
    std::string version;
};

// First "\b\d+\.\d+\.\d+\b" match in `url`, else kUnknownVersion.
std::string ExtractVersionFromUrl(const std::string& url);

class ReleaseResolver {
public:
    ReleaseResolver(IHttpClient& http, const UpdaterConfig& config);

    // One GET against the release endpoint, no retries.
    Outcome<RemoteRelease> Resolve(const std::string& platform);
    Outcome<RemoteRelease> Resolve() { return Resolve(config_.platform); }

    // Exposed for tests: turn a response body into a release.
    static Outcome<RemoteRelease> ParseResponse(const std::string& body);

private:
    IHttpClient& http_;
    const UpdaterConfig& config_;
};

} // namespace cursorup
