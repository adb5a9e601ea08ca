#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

namespace cursorup {

// $HOME, or "/root" as a last resort so a sudo-less root shell still works.
inline std::string HomeDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home != '\0') return home;
    return "/root";
}

// Expand a leading "~" or "~/" against $HOME. Other paths are returned as-is.
inline std::string ExpandUser(std::string_view path) {
    if (path == "~") return HomeDirectory();
    if (path.rfind("~/", 0) == 0) return HomeDirectory() + std::string(path.substr(1));
    return std::string(path);
}

// Quote for /bin/sh; used only when echoing commands into the log.
inline std::string ShellQuote(std::string_view s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

inline std::string TrimWhitespace(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

} // namespace cursorup
