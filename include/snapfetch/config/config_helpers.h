#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace snapfetch::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Remove a trailing '#' comment that is not inside a quoted string
std::string strip_comment(std::string_view line);

/**
 * Parse a TOML-style file into "section.key" -> raw value (strings unquoted,
 * arrays kept in their bracketed form). Arrays may span several lines.
 * Returns an empty map when the file cannot be read.
 */
std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path);

// Parse ["a", "b"] or a plain comma-separated list into unquoted items.
std::vector<std::string> parse_string_list(const std::string& raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/snapfetch or ~/.config/snapfetch
std::filesystem::path get_config_dir();

// Get standard config path (override wins when non-empty)
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace snapfetch::config
