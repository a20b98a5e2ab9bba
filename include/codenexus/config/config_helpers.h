#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <codenexus/core/types.h>

namespace codenexus::config {

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
            if (path.size() <= 2) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from TOML config file. Accepts both "[section] key = v" and
// "section.key = v". Returns an empty string when the key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config file path
/// $XDG_CONFIG_HOME/codenexus/config.toml or ~/.config/codenexus/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Server-wide settings. Every project managed by one server process shares them.
 */
struct NexusConfig {
    // Name of the per-project metadata directory created under the project root
    std::string dataDirName = ".codenexus";
    // Keep a <name>.json.bak copy of each snapshot before overwriting it
    bool backupOnWrite = true;
    std::string logLevel = "info";
    std::size_t suggestionLimit = 10;
    std::size_t defaultMaxDepth = 3;
};

/**
 * Load settings from a config file. A missing file yields the defaults.
 * CODENEXUS_LOG_LEVEL overrides [logging] level.
 */
Result<NexusConfig> load_config(const std::filesystem::path& config_path);

} // namespace codenexus::config
