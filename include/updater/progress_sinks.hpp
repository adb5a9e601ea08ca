#pragma once

#include "updater/progress.hpp"

#include <cstdint>
#include <cstdio>

namespace cursorup {

// Single carriage-returned status line:
//   Download progress: 42% [1048576 / 2496512 bytes]
class ConsoleProgressSink final : public IProgress {
public:
    explicit ConsoleProgressSink(std::FILE* out = stdout) : out_(out) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::FILE* out_;
    int last_pct_ = -1;
    std::uint64_t last_done_ = 0;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace cursorup
