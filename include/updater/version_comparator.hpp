#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cursorup {

// Sentinel used when no version can be derived from the download location.
inline constexpr std::string_view kUnknownVersion = "Unknown";

struct SemanticVersion {
    std::vector<std::uint64_t> numbers;
    std::string prerelease;
};

// Accepts an optional leading 'v', dot-separated numeric components, an optional
// "-prerelease" tag and an ignored "+build" suffix. Anything else is a
// VersionParseError.
Outcome<SemanticVersion> ParseSemanticVersion(std::string_view text);

struct UpdateDecision {
    enum class Reason {
        Forced,
        NotInstalled,
        LatestUnknown,
        Newer,
        NotNewer,
        // Degraded mode after a parse failure on either side.
        StringsDiffer,
        StringsEqual,
    };

    bool update_needed = false;
    Reason reason = Reason::NotNewer;
};

const char* ToString(UpdateDecision::Reason reason);

class VersionComparator {
public:
    // <0, 0, >0 like strcmp. Missing trailing components count as zero and a
    // pre-release sorts before the plain release.
    static int Compare(const SemanticVersion& lhs, const SemanticVersion& rhs);

    static UpdateDecision Decide(const std::optional<std::string>& installed,
                                 const std::string& latest,
                                 bool force);
};

} // namespace cursorup
