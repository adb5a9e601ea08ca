#include "updater/artifact_fetcher.hpp"

#include "crypto/sha256.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace cursorup {

namespace {

// Forwards to the temp file while hashing and counting what was written.
class HashingWriter final : public IWriter {
public:
    explicit HashingWriter(IWriter& inner) : inner_(inner) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        auto res = inner_.WriteAll(in);
        if (!res.is_ok()) return res;
        hasher_.Update(in);
        written_ += in.size();
        return res;
    }

    Result FsyncNow() override { return inner_.FsyncNow(); }

    std::uint64_t Written() const { return written_; }
    std::string FinalHex() { return hasher_.FinalHex(); }

private:
    IWriter& inner_;
    Sha256Hasher hasher_;
    std::uint64_t written_ = 0;
};

Result MarkExecutable(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return Result::Fail(ErrorKind::DownloadError,
                            "stat " + path + " failed (" + std::strerror(errno) + ")");
    }
    if (::chmod(path.c_str(), (st.st_mode & 07777) | S_IXUSR) != 0) {
        return Result::Fail(ErrorKind::DownloadError,
                            "chmod +x " + path + " failed (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

} // namespace

ArtifactFetcher::ArtifactFetcher(IHttpClient& http, const UpdaterConfig& config, IProgress* progress)
    : http_(http), config_(config), progress_sink_(progress) {}

Outcome<FetchedArtifact> ArtifactFetcher::Fetch(const std::string& url, TempFile& artifact) {
    auto created = TempFile::Create(config_.temp_dir, config_.backup_prefix + "-", ".AppImage", artifact);
    if (!created.is_ok())
        return Unexpected(ErrorKind::DownloadError, "cannot create download file: " + created.msg);

    LogInfo("Downloading from %s", url.c_str());
    LogDebug("Download target: %s", artifact.Path().c_str());

    DownloadRequest req;
    req.url = url;
    req.headers = {{"User-Agent", config_.user_agent}};
    req.connect_timeout_sec = config_.connect_timeout_sec;
    req.stall_timeout_sec = config_.download_stall_timeout_sec;

    HashingWriter writer(artifact);
    std::uint64_t last_total = 0;
    const DownloadProgressFn on_progress = [this, &last_total](std::uint64_t done, std::uint64_t total) {
        if (CancelRequested()) return false;
        last_total = total;
        if (progress_sink_ && done > 0) {
            progress_sink_->OnProgress(ProgressEvent{.label = "Download", .done = done, .total = total});
        }
        return true;
    };

    auto res = http_.Download(req, writer, on_progress);
    if (!res.is_ok()) {
        if (res.kind == ErrorKind::Cancelled)
            return Unexpected(res);
        LogError("Download failed: %s", res.msg.c_str());
        return Unexpected(ErrorKind::DownloadError, res.msg);
    }

    if (progress_sink_) {
        progress_sink_->OnProgress(ProgressEvent{
            .label = "Download", .done = writer.Written(), .total = last_total, .finished = true});
    }

    if (writer.Written() == 0)
        return Unexpected(ErrorKind::DownloadError, "server returned an empty file for " + url);

    if (auto fr = writer.FsyncNow(); !fr.is_ok())
        return Unexpected(ErrorKind::DownloadError, fr.msg);
    if (auto cr = artifact.Close(); !cr.is_ok())
        return Unexpected(ErrorKind::DownloadError, cr.msg);
    if (auto xr = MarkExecutable(artifact.Path()); !xr.is_ok())
        return Unexpected(xr);

    FetchedArtifact out;
    out.path = artifact.Path();
    out.bytes = writer.Written();
    out.sha256 = writer.FinalHex();
    LogInfo("Downloaded %llu bytes, sha256=%s",
            (unsigned long long)out.bytes,
            out.sha256.empty() ? "(unavailable)" : out.sha256.c_str());
    return out;
}

} // namespace cursorup
