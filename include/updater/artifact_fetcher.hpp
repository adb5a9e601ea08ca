#pragma once

#include "io/temp_file.hpp"
#include "net/http_client.hpp"
#include "updater/progress.hpp"
#include "util/result.hpp"
#include "util/updater_config.hpp"

#include <cstdint>
#include <string>

namespace cursorup {

struct FetchedArtifact {
    std::string path;
    std::uint64_t bytes = 0;
    std::string sha256;
};

class ArtifactFetcher {
public:
    ArtifactFetcher(IHttpClient& http, const UpdaterConfig& config, IProgress* progress = nullptr);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    // Streams `url` into a fresh `<temp_dir>/<backup_prefix>-XXXXXX.AppImage`
    // held by `artifact`, then marks it executable. On failure the partial file
    // stays owned by `artifact`, which unlinks it when destroyed.
    Outcome<FetchedArtifact> Fetch(const std::string& url, TempFile& artifact);

private:
    IHttpClient& http_;
    const UpdaterConfig& config_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace cursorup
