#include <codenexus/metadata/path_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace codenexus::metadata {

namespace fs = std::filesystem;

namespace {

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Component-wise prefix test; "/a/bc" is not inside "/a/b"
bool isWithin(const fs::path& child, const fs::path& parent) {
    auto mismatch = std::mismatch(parent.begin(), parent.end(), child.begin(), child.end());
    return mismatch.first == parent.end();
}

std::string toForwardSlashes(std::string s) {
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

} // namespace

Result<fs::path> validateProjectPath(const std::string& projectPath) {
    if (isBlank(projectPath)) {
        return Error{ErrorCode::ConfigError, "Project path must not be empty"};
    }

    std::error_code ec;
    const fs::path path = config::expand_tilde(projectPath);
    if (!fs::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Project path does not exist: " + projectPath};
    }
    if (!fs::is_directory(path, ec)) {
        return Error{ErrorCode::ConfigError, "Project path must be a directory: " + projectPath};
    }

    auto canonical = fs::canonical(path, ec);
    if (ec) {
        return Error{ErrorCode::FileSystemError,
                     "Cannot resolve project path " + projectPath + ": " + ec.message()};
    }

    spdlog::debug("Validated project path {}", canonical.string());
    return canonical;
}

Result<fs::path> validateFilePath(const fs::path& projectPath, const std::string& filePath) {
    if (isBlank(filePath)) {
        return Error{ErrorCode::ConfigError, "File path must not be empty"};
    }

    std::error_code ec;
    const fs::path fullPath = projectPath / fs::path(filePath);
    if (!fs::exists(fullPath, ec)) {
        return Error{ErrorCode::FileNotFound,
                     "File does not exist: " + filePath + " (full path: " + fullPath.string() + ")"};
    }
    if (!fs::is_regular_file(fullPath, ec)) {
        return Error{ErrorCode::ConfigError, "Path must name a file, not a directory: " + filePath};
    }

    auto canonicalFile = fs::canonical(fullPath, ec);
    if (ec) {
        return Error{ErrorCode::FileSystemError,
                     "Cannot resolve file path " + filePath + ": " + ec.message()};
    }
    auto canonicalProject = fs::canonical(projectPath, ec);
    if (ec) {
        return Error{ErrorCode::FileSystemError,
                     "Cannot resolve project path " + projectPath.string() + ": " + ec.message()};
    }

    if (!isWithin(canonicalFile, canonicalProject)) {
        spdlog::warn("File path escapes the project: {}", canonicalFile.string());
        return Error{ErrorCode::ConfigError,
                     "File path must be inside the project directory: " + filePath};
    }

    return canonicalFile;
}

Result<std::string> normalizeFilePath(const fs::path& projectPath, const fs::path& filePath) {
    std::error_code ec;
    auto canonicalProject = fs::canonical(projectPath, ec);
    if (ec) {
        return Error{ErrorCode::FileSystemError,
                     "Cannot resolve project path " + projectPath.string() + ": " + ec.message()};
    }
    auto canonicalFile = fs::canonical(filePath, ec);
    if (ec) {
        return Error{ErrorCode::FileSystemError,
                     "Cannot resolve file path " + filePath.string() + ": " + ec.message()};
    }
    if (!isWithin(canonicalFile, canonicalProject)) {
        return Error{ErrorCode::ConfigError,
                     "File path is not inside the project directory: " + filePath.string()};
    }

    return toForwardSlashes(canonicalFile.lexically_relative(canonicalProject).generic_string());
}

Result<std::string> normalizeRelativePath(const std::string& filePath) {
    if (isBlank(filePath)) {
        return Error{ErrorCode::ConfigError, "File path must not be empty"};
    }

    const fs::path path(toForwardSlashes(filePath));
    if (path.is_absolute() || path.has_root_name()) {
        return Error{ErrorCode::ConfigError, "File path must be relative to the project: " + filePath};
    }

    std::string normalized = path.lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    if (normalized.empty() || normalized == "." || normalized == ".." ||
        normalized.rfind("../", 0) == 0) {
        return Error{ErrorCode::ConfigError,
                     "File path must stay inside the project directory: " + filePath};
    }
    return normalized;
}

fs::path getDataDir(const fs::path& projectPath, const config::NexusConfig& config) {
    return projectPath / config.dataDirName;
}

} // namespace codenexus::metadata
