#include "updater/release_resolver.hpp"

#include "updater/version_comparator.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>
#include <regex>

namespace cursorup {

using json = nlohmann::json;

std::string ExtractVersionFromUrl(const std::string& url) {
    static const std::regex kVersionPattern(R"(\b(\d+\.\d+\.\d+)\b)");
    std::smatch match;
    if (std::regex_search(url, match, kVersionPattern))
        return match[1].str();
    return std::string(kUnknownVersion);
}

ReleaseResolver::ReleaseResolver(IHttpClient& http, const UpdaterConfig& config)
    : http_(http), config_(config) {}

Outcome<RemoteRelease> ReleaseResolver::ParseResponse(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return Unexpected(ErrorKind::RemoteProtocolError,
                          std::string("API response is not JSON: ") + e.what());
    }

    if (!j.is_object())
        return Unexpected(ErrorKind::RemoteProtocolError, "API response must be a JSON object");

    auto it = j.find("downloadUrl");
    if (it == j.end())
        return Unexpected(ErrorKind::RemoteProtocolError, "downloadUrl missing from API response");
    if (!it->is_string() || it->get<std::string>().empty())
        return Unexpected(ErrorKind::RemoteProtocolError, "downloadUrl in API response is not a URL");

    RemoteRelease release;
    release.download_url = it->get<std::string>();
    release.version = ExtractVersionFromUrl(release.download_url);
    return release;
}

Outcome<RemoteRelease> ReleaseResolver::Resolve(const std::string& platform) {
    HttpRequest req;
    req.url = config_.api_endpoint;
    req.query = {{"platform", platform}, {"releaseTrack", config_.release_track}};
    req.headers = {{"User-Agent", config_.user_agent}, {"Cache-Control", "no-cache"}};
    req.timeout_sec = config_.metadata_timeout_sec;
    req.connect_timeout_sec = config_.connect_timeout_sec;

    auto response = http_.Get(req);
    if (!response) {
        LogError("Network error: %s", response.error().msg.c_str());
        return std::unexpected(response.error());
    }

    auto release = ParseResponse(response->body);
    if (!release) {
        LogError("API response error: %s", release.error().msg.c_str());
        return release;
    }

    LogDebug("Resolved download URL: %s", release->download_url.c_str());
    if (release->version == kUnknownVersion) {
        LogWarn("No version number found in download URL %s", release->download_url.c_str());
    }
    return release;
}

} // namespace cursorup
