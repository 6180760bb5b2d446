#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace ytarchive::config {

inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline std::string trimmed(std::string s) {
    ltrim(s);
    rtrim(s);
    return s;
}

// "~" and "~/x" expand against $HOME; anything else is returned unchanged.
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    if (path.size() == 1) {
        return std::filesystem::path(home);
    }
    if (path[1] == '/') {
        return std::filesystem::path(home) / path.substr(2);
    }
    return path;
}

/// Returns the user config directory
/// $XDG_CONFIG_HOME/ytarchive or ~/.config/ytarchive
std::filesystem::path get_config_dir();

} // namespace ytarchive::config
