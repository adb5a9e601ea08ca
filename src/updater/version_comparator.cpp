#include "updater/version_comparator.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace cursorup {

namespace {

bool IsPrereleaseChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-';
}

bool IsNumericIdentifier(std::string_view id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// Numeric identifiers compare by value and sort before alphanumeric ones.
int CompareIdentifier(std::string_view lhs, std::string_view rhs) {
    const bool lnum = IsNumericIdentifier(lhs);
    const bool rnum = IsNumericIdentifier(rhs);
    if (lnum && rnum) {
        lhs.remove_prefix(std::min(lhs.find_first_not_of('0'), lhs.size()));
        rhs.remove_prefix(std::min(rhs.find_first_not_of('0'), rhs.size()));
        if (lhs.size() != rhs.size())
            return lhs.size() < rhs.size() ? -1 : 1;
    } else if (lnum != rnum) {
        return lnum ? -1 : 1;
    }
    const int c = lhs.compare(rhs);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int ComparePrerelease(std::string_view lhs, std::string_view rhs) {
    while (!lhs.empty() && !rhs.empty()) {
        const auto ldot = lhs.find('.');
        const auto rdot = rhs.find('.');
        if (const int c = CompareIdentifier(lhs.substr(0, ldot), rhs.substr(0, rdot)); c != 0)
            return c;
        lhs = ldot == std::string_view::npos ? std::string_view{} : lhs.substr(ldot + 1);
        rhs = rdot == std::string_view::npos ? std::string_view{} : rhs.substr(rdot + 1);
    }
    if (lhs.empty() == rhs.empty())
        return 0;
    return lhs.empty() ? -1 : 1;
}

} // namespace

Outcome<SemanticVersion> ParseSemanticVersion(std::string_view text) {
    const std::string original(text);
    auto fail = [&original](const char* why) {
        return Unexpected(ErrorKind::VersionParseError,
                          "invalid version '" + original + "': " + why);
    };

    if (!text.empty() && (text.front() == 'v' || text.front() == 'V'))
        text.remove_prefix(1);
    if (text.empty())
        return fail("empty");

    if (const auto plus = text.find('+'); plus != std::string_view::npos)
        text = text.substr(0, plus);

    SemanticVersion out;
    if (const auto dash = text.find('-'); dash != std::string_view::npos) {
        out.prerelease = std::string(text.substr(dash + 1));
        text = text.substr(0, dash);
        if (out.prerelease.empty())
            return fail("empty pre-release tag");
        for (const char c : out.prerelease) {
            if (!IsPrereleaseChar(c))
                return fail("bad character in pre-release tag");
        }
    }

    while (true) {
        const auto dot = text.find('.');
        const std::string_view part = text.substr(0, dot);
        if (part.empty())
            return fail("empty numeric component");

        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc() || ptr != part.data() + part.size())
            return fail("non-numeric component");
        out.numbers.push_back(value);

        if (dot == std::string_view::npos)
            break;
        text.remove_prefix(dot + 1);
    }

    return out;
}

int VersionComparator::Compare(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    const size_t n = std::max(lhs.numbers.size(), rhs.numbers.size());
    for (size_t i = 0; i < n; ++i) {
        const std::uint64_t l = i < lhs.numbers.size() ? lhs.numbers[i] : 0;
        const std::uint64_t r = i < rhs.numbers.size() ? rhs.numbers[i] : 0;
        if (l > r)
            return 1;
        if (l < r)
            return -1;
    }

    if (lhs.prerelease == rhs.prerelease)
        return 0;
    if (lhs.prerelease.empty())
        return 1;
    if (rhs.prerelease.empty())
        return -1;
    return ComparePrerelease(lhs.prerelease, rhs.prerelease);
}

UpdateDecision VersionComparator::Decide(const std::optional<std::string>& installed,
                                         const std::string& latest,
                                         bool force) {
    using Reason = UpdateDecision::Reason;

    if (force)
        return {true, Reason::Forced};
    if (!installed)
        return {true, Reason::NotInstalled};
    if (latest == kUnknownVersion)
        return {true, Reason::LatestUnknown};

    auto installed_v = ParseSemanticVersion(*installed);
    auto latest_v = ParseSemanticVersion(latest);
    if (!installed_v || !latest_v) {
        const Error& err = !installed_v ? installed_v.error() : latest_v.error();
        LogWarn("Could not compare versions semantically (%s), falling back to string comparison",
                err.msg.c_str());
        if (*installed != latest)
            return {true, Reason::StringsDiffer};
        return {false, Reason::StringsEqual};
    }

    if (Compare(*latest_v, *installed_v) > 0)
        return {true, Reason::Newer};
    return {false, Reason::NotNewer};
}

const char* ToString(UpdateDecision::Reason reason) {
    using Reason = UpdateDecision::Reason;
    switch (reason) {
        case Reason::Forced:        return "forced";
        case Reason::NotInstalled:  return "not installed";
        case Reason::LatestUnknown: return "latest version unknown";
        case Reason::Newer:         return "newer version available";
        case Reason::NotNewer:      return "installed version is current";
        case Reason::StringsDiffer: return "version strings differ";
        case Reason::StringsEqual:  return "version strings equal";
    }
    return "unknown";
}

} // namespace cursorup
