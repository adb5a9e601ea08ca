#include "updater/preflight.hpp"

#include "system/process.hpp"
#include "util/logger.hpp"

namespace cursorup {

Result CheckDependencies(const std::vector<std::string>& tools) {
    std::string missing;
    for (const auto& tool : tools) {
        if (auto found = FindExecutable(tool)) {
            LogDebug("Found %s at %s", tool.c_str(), found->c_str());
            continue;
        }
        if (!missing.empty()) missing += ", ";
        missing += tool;
    }

    if (!missing.empty()) {
        LogError("Missing dependencies: %s", missing.c_str());
        return Result::Fail(ErrorKind::PreflightError, "missing required tools: " + missing);
    }
    return Result::Ok();
}

} // namespace cursorup
