#include "updater/progress_sinks.hpp"

#include <atomic>

namespace cursorup {

namespace {
std::atomic<std::FILE*> g_progress_line{nullptr};

constexpr std::uint64_t kUnknownTotalStep = 1024 * 1024ULL;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (e.total > 0) {
        int pct = static_cast<int>((e.done * 100ULL) / e.total);
        if (pct > 100)
            pct = 100;
        if (pct == last_pct_ && !e.finished)
            return;
        last_pct_ = pct;
        std::fprintf(out_,
                     "\r%.*s progress: %d%% [%llu / %llu bytes]",
                     (int)e.label.size(),
                     e.label.data(),
                     pct,
                     (unsigned long long)e.done,
                     (unsigned long long)e.total);
    } else {
        if (e.done < last_done_ + kUnknownTotalStep && !e.finished)
            return;
        last_done_ = e.done;
        std::fprintf(out_,
                     "\r%.*s progress: %llu bytes",
                     (int)e.label.size(),
                     e.label.data(),
                     (unsigned long long)e.done);
    }
    std::fflush(out_);
    g_progress_line.store(out_);

    if (e.finished) {
        std::fprintf(out_, "\n");
        std::fflush(out_);
        g_progress_line.store(nullptr);
    }
}

bool IsProgressLineActive() { return g_progress_line.load() != nullptr; }

void ClearProgressLine() {
    if (std::FILE* out = g_progress_line.exchange(nullptr)) {
        std::fprintf(out, "\n");
        std::fflush(out);
    }
}

} // namespace cursorup
