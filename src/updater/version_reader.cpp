#include "updater/version_reader.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace cursorup {

std::optional<std::string> ReadInstalledVersion(const std::string& metadata_path,
                                                const std::string& key) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_regular_file(metadata_path, ec)) {
        LogDebug("No installed metadata at %s", metadata_path.c_str());
        return std::nullopt;
    }

    std::ifstream is(metadata_path);
    if (!is.is_open()) {
        LogWarn("Could not read %s: %s", metadata_path.c_str(), std::strerror(errno));
        return std::nullopt;
    }

    const std::string prefix = key + "=";
    std::string line;
    while (std::getline(is, line)) {
        if (line.rfind(prefix, 0) != 0)
            continue;
        std::string value = TrimWhitespace(std::string_view(line).substr(prefix.size()));
        if (value.empty())
            return std::nullopt;
        return value;
    }

    if (is.bad()) {
        LogWarn("Error while reading %s", metadata_path.c_str());
    }
    return std::nullopt;
}

} // namespace cursorup
