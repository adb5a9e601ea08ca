#pragma once
#include <cstdint>
#include <string_view>

namespace cursorup {

struct ProgressEvent {
    std::string_view label;
    std::uint64_t done = 0;
    // 0 => unknown; sinks must not compute percentages.
    std::uint64_t total = 0;
    bool finished = false;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace cursorup
