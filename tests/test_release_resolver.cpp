#include <gtest/gtest.h>

#include "testing.hpp"
#include "updater/release_resolver.hpp"
#include "updater/version_comparator.hpp"

namespace cursorup {
namespace {

TEST(ReleaseResolverTest, ExtractsFirstDottedTripleFromUrl) {
    EXPECT_EQ(ExtractVersionFromUrl(
                  "https://downloads.cursor.com/production/abc/linux/x64/Cursor-0.43.1-x86_64.AppImage"),
              "0.43.1");
    EXPECT_EQ(ExtractVersionFromUrl("https://example.com/1.2.3/app-4.5.6.AppImage"), "1.2.3");
    EXPECT_EQ(ExtractVersionFromUrl("https://example.com/app-latest.AppImage"), kUnknownVersion);
    EXPECT_EQ(ExtractVersionFromUrl("https://example.com/app-1.2.AppImage"), kUnknownVersion);
}

TEST(ReleaseResolverTest, SendsPlatformTrackAndHeaders) {
    testutil::FakeHttpClient http;
    http.get_response = HttpResponse{
        .status_code = 200,
        .body = R"({"downloadUrl":"https://dl.example/cursor-0.43.1-x86_64.AppImage"})",
        .effective_url = ""};
    UpdaterConfig cfg;

    ReleaseResolver resolver(http, cfg);
    auto release = resolver.Resolve();
    ASSERT_TRUE(release.has_value()) << release.error().msg;
    EXPECT_EQ(release->download_url, "https://dl.example/cursor-0.43.1-x86_64.AppImage");
    EXPECT_EQ(release->version, "0.43.1");

    EXPECT_EQ(http.get_calls, 1);
    EXPECT_EQ(http.last_get.url, cfg.api_endpoint);
    ASSERT_EQ(http.last_get.query.size(), 2u);
    EXPECT_EQ(http.last_get.query[0], (std::pair<std::string, std::string>{"platform", "linux-x64"}));
    EXPECT_EQ(http.last_get.query[1], (std::pair<std::string, std::string>{"releaseTrack", "latest"}));
    EXPECT_EQ(http.last_get.headers.at("User-Agent"), "Cursor-Version-Checker");
    EXPECT_EQ(http.last_get.headers.at("Cache-Control"), "no-cache");
    EXPECT_EQ(http.last_get.timeout_sec, 15u);
}

TEST(ReleaseResolverTest, UrlWithoutVersionYieldsUnknown) {
    auto release = ReleaseResolver::ParseResponse(R"({"downloadUrl":"https://dl.example/latest.AppImage"})");
    ASSERT_TRUE(release.has_value());
    EXPECT_EQ(release->version, kUnknownVersion);
}

TEST(ReleaseResolverTest, MalformedBodiesAreProtocolErrors) {
    for (const char* body : {"not json", "[]", "{}", R"({"downloadUrl":42})", R"({"downloadUrl":""})"}) {
        auto release = ReleaseResolver::ParseResponse(body);
        ASSERT_FALSE(release.has_value()) << body;
        EXPECT_EQ(release.error().kind, ErrorKind::RemoteProtocolError) << body;
    }
}

TEST(ReleaseResolverTest, NetworkErrorsPassThrough) {
    testutil::FakeHttpClient http;
    http.get_response = Unexpected(ErrorKind::NetworkError, "HTTP 503");
    UpdaterConfig cfg;

    ReleaseResolver resolver(http, cfg);
    auto release = resolver.Resolve("linux-arm64");
    ASSERT_FALSE(release.has_value());
    EXPECT_EQ(release.error().kind, ErrorKind::NetworkError);
    EXPECT_EQ(http.last_get.query[0].second, "linux-arm64");
}

} // namespace
} // namespace cursorup
