#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cleanbench::config {

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
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from TOML config file. Returns "" when the file, section or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list. Accepts "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

// Parse "10s", "2m", "500ms", "1h" or a bare number of seconds.
std::optional<std::chrono::milliseconds> parse_duration(std::string_view text);

// Get standard config path: $CLEANBENCH_CONFIG, then XDG, then ~/.config/cleanbench/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Environment lookup that treats an empty variable as unset
std::optional<std::string> env_value(const char* name);

} // namespace cleanbench::config
