#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <codenexus/config/config_helpers.h>

namespace codenexus::config {

namespace {

Result<bool> parse_bool(const std::string& key, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on")
        return true;
    if (value == "false" || value == "0" || value == "no" || value == "off")
        return false;
    return Error{ErrorCode::ConfigError, "Invalid boolean for '" + key + "': " + value};
}

Result<std::size_t> parse_size(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < 0) {
            return Error{ErrorCode::ConfigError,
                         "Invalid non-negative integer for '" + key + "': " + value};
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        return Error{ErrorCode::ConfigError, "Invalid integer for '" + key + "': " + value};
    }
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside of quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (!v.empty()) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "codenexus" / "config.toml";
    }

    return configHome / "codenexus" / "config.toml";
}

Result<NexusConfig> load_config(const std::filesystem::path& config_path) {
    NexusConfig cfg;

    std::error_code ec;
    if (!config_path.empty() && std::filesystem::exists(config_path, ec)) {
        spdlog::debug("Loading configuration from {}", config_path.string());

        if (auto v = parse_config_value(config_path, "storage", "data_dir_name"); !v.empty()) {
            if (v.find('/') != std::string::npos || v.find('\\') != std::string::npos ||
                v == "." || v == "..") {
                return Error{ErrorCode::ConfigError,
                             "storage.data_dir_name must be a single directory name: " + v};
            }
            cfg.dataDirName = v;
        }
        if (auto v = parse_config_value(config_path, "storage", "backup_on_write"); !v.empty()) {
            auto parsed = parse_bool("storage.backup_on_write", v);
            if (!parsed)
                return parsed.error();
            cfg.backupOnWrite = parsed.value();
        }
        if (auto v = parse_config_value(config_path, "logging", "level"); !v.empty()) {
            cfg.logLevel = v;
        }
        if (auto v = parse_config_value(config_path, "query", "suggestion_limit"); !v.empty()) {
            auto parsed = parse_size("query.suggestion_limit", v);
            if (!parsed)
                return parsed.error();
            cfg.suggestionLimit = parsed.value();
        }
        if (auto v = parse_config_value(config_path, "graph", "default_max_depth"); !v.empty()) {
            auto parsed = parse_size("graph.default_max_depth", v);
            if (!parsed)
                return parsed.error();
            cfg.defaultMaxDepth = parsed.value();
        }
    } else {
        spdlog::debug("No configuration file at {}, using defaults", config_path.string());
    }

    if (const char* env = std::getenv("CODENEXUS_LOG_LEVEL"); env && *env) {
        cfg.logLevel = env;
    }

    return cfg;
}

} // namespace codenexus::config
