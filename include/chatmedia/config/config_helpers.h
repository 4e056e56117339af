#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatmedia::config {

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

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Accepts true/false, yes/no, on/off and 1/0; anything else yields nullopt
std::optional<bool> parse_bool(std::string_view s);

// Millisecond durations written as plain integers
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

/// Flattened view of a TOML-style file: keys are "section.key" (or "key" before any section)
using ConfigValues = std::map<std::string, std::string>;

// Parse a whole TOML-style config file. Missing files yield an empty map.
ConfigValues parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a TOML-style config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of paths into filesystem paths.
// Accepts forms like "a,b" or ["a", "b"]. Tilde expansion is applied.
std::vector<std::filesystem::path> parse_path_list(const std::string& raw);

// Get standard config path ($CHATMEDIA_CONFIG, then XDG)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/chatmedia or ~/.config/chatmedia
std::filesystem::path get_config_dir();

/// Returns the user cache directory (decoded media, extracted decoder binaries)
/// Unix: $XDG_CACHE_HOME/chatmedia or ~/.cache/chatmedia
std::filesystem::path get_cache_dir();

} // namespace chatmedia::config
