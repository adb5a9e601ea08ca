#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "system/signals.hpp"
#include "testing.hpp"
#include "updater/artifact_fetcher.hpp"

#include <filesystem>
#include <sys/stat.h>

namespace cursorup {
namespace {

namespace fs = std::filesystem;

class ArtifactFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ResetCancel();
        cfg_.temp_dir = tmp_.Path();
    }
    void TearDown() override { ResetCancel(); }

    testutil::TemporaryDirectory tmp_;
    testutil::FakeHttpClient http_;
    testutil::RecordingProgress progress_;
    UpdaterConfig cfg_;
};

TEST_F(ArtifactFetcherTest, StreamsBodyIntoExecutableTempFile) {
    http_.download_body = "#!/bin/sh\necho fake appimage\n";
    ArtifactFetcher fetcher(http_, cfg_, &progress_);
    TempFile artifact;

    auto res = fetcher.Fetch("https://dl.example/cursor-0.43.1.AppImage", artifact);
    ASSERT_TRUE(res.has_value()) << res.error().msg;
    EXPECT_EQ(res->path, artifact.Path());
    EXPECT_EQ(fs::path(res->path).parent_path().string(), tmp_.Path());
    EXPECT_EQ(fs::path(res->path).extension().string(), ".AppImage");
    EXPECT_EQ(res->bytes, http_.download_body.size());
    EXPECT_EQ(res->sha256, Sha256Hex(http_.download_body));
    EXPECT_EQ(testutil::ReadTextFile(res->path), http_.download_body);

    struct stat st{};
    ASSERT_EQ(::stat(res->path.c_str(), &st), 0);
    EXPECT_NE(st.st_mode & S_IXUSR, 0u);

    EXPECT_EQ(http_.last_download.url, "https://dl.example/cursor-0.43.1.AppImage");
    EXPECT_EQ(http_.last_download.headers.at("User-Agent"), cfg_.user_agent);

    ASSERT_FALSE(progress_.events.empty());
    EXPECT_EQ(progress_.events.front().total, http_.download_body.size());
    EXPECT_TRUE(progress_.events.back().finished);
    EXPECT_EQ(progress_.events.back().done, http_.download_body.size());
}

TEST_F(ArtifactFetcherTest, UnknownLengthStillSucceeds) {
    http_.declare_length = false;
    ArtifactFetcher fetcher(http_, cfg_, &progress_);
    TempFile artifact;

    auto res = fetcher.Fetch("https://dl.example/a.AppImage", artifact);
    ASSERT_TRUE(res.has_value()) << res.error().msg;
    for (const auto& e : progress_.events) {
        EXPECT_EQ(e.total, 0u);
    }
}

TEST_F(ArtifactFetcherTest, TransportFailureIsDownloadErrorAndFileIsReleased) {
    http_.download_result = Result::Fail(ErrorKind::NetworkError, "HTTP 404");
    ArtifactFetcher fetcher(http_, cfg_);
    std::string partial;
    {
        TempFile artifact;
        auto res = fetcher.Fetch("https://dl.example/a.AppImage", artifact);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().kind, ErrorKind::DownloadError);
        partial = artifact.Path();
        EXPECT_TRUE(fs::exists(partial));
    }
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_TRUE(testutil::ListDirectory(tmp_.Path()).empty());
}

TEST_F(ArtifactFetcherTest, EmptyBodyIsDownloadError) {
    http_.download_body.clear();
    ArtifactFetcher fetcher(http_, cfg_);
    TempFile artifact;
    auto res = fetcher.Fetch("https://dl.example/a.AppImage", artifact);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::DownloadError);
}

TEST_F(ArtifactFetcherTest, CancelFlagAbortsTransfer) {
    g_cancel.store(true);
    ArtifactFetcher fetcher(http_, cfg_);
    TempFile artifact;
    auto res = fetcher.Fetch("https://dl.example/a.AppImage", artifact);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Cancelled);
}

TEST_F(ArtifactFetcherTest, MissingTempDirIsDownloadError) {
    cfg_.temp_dir = tmp_.Path() + "/does/not/exist";
    ArtifactFetcher fetcher(http_, cfg_);
    TempFile artifact;
    auto res = fetcher.Fetch("https://dl.example/a.AppImage", artifact);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::DownloadError);
    EXPECT_EQ(http_.download_calls, 0);
}

} // namespace
} // namespace cursorup
