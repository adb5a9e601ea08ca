#include <gtest/gtest.h>

#include "io/temp_file.hpp"
#include "net/curl_http_client.hpp"
#include "testing.hpp"

namespace cursorup {
namespace {

TEST(CurlHttpClientTest, BuildUrlEscapesQuery) {
    EXPECT_EQ(CurlHttpClient::BuildUrl("https://www.cursor.com/api/download",
                                       {{"platform", "linux-x64"}, {"releaseTrack", "latest"}}),
              "https://www.cursor.com/api/download?platform=linux-x64&releaseTrack=latest");
    EXPECT_EQ(CurlHttpClient::BuildUrl("https://h/api?a=1", {{"q", "a b&c"}}),
              "https://h/api?a=1&q=a%20b%26c");
    EXPECT_EQ(CurlHttpClient::BuildUrl("https://h/api", {}), "https://h/api");
}

// Port 1 on loopback is never listening in the test environment.
TEST(CurlHttpClientTest, RefusedConnectionIsNetworkError) {
    CurlHttpClient client;
    HttpRequest req;
    req.url = "http://127.0.0.1:1/api/download";
    req.timeout_sec = 5;
    req.connect_timeout_sec = 5;

    auto res = client.Get(req);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::NetworkError);
}

TEST(CurlHttpClientTest, RefusedDownloadWritesNothing) {
    testutil::TemporaryDirectory tmp;
    TempFile sink;
    ASSERT_TRUE(TempFile::Create(tmp.Path(), "dl-", "", sink).is_ok());

    CurlHttpClient client;
    DownloadRequest req;
    req.url = "http://127.0.0.1:1/cursor.AppImage";
    req.connect_timeout_sec = 5;

    int progress_calls = 0;
    auto res = client.Download(req, sink, [&](std::uint64_t, std::uint64_t) {
        ++progress_calls;
        return true;
    });
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::NetworkError);
    EXPECT_EQ(testutil::ReadTextFile(sink.Path()), "");
}

} // namespace
} // namespace cursorup
