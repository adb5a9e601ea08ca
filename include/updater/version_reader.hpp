#pragma once

#include <optional>
#include <string>

namespace cursorup {

// Reads `KEY=VALUE` metadata (the bundle's .desktop entry) and returns the
// trimmed value of `key`. Absent when the file is missing, unreadable, or the
// key is missing or empty; unreadable files are logged, never fatal.
std::optional<std::string> ReadInstalledVersion(const std::string& metadata_path,
                                                const std::string& key);

} // namespace cursorup
