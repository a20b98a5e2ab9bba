#pragma once

#include <codenexus/config/config_helpers.h>
#include <codenexus/core/types.h>

#include <filesystem>
#include <string>

namespace codenexus::metadata {

/**
 * @brief Check that a project root exists and is a directory.
 * @return The canonical absolute path of the project.
 */
Result<std::filesystem::path> validateProjectPath(const std::string& projectPath);

/**
 * @brief Check that a project-relative file exists, is a regular file and stays inside
 * the project after symlinks are resolved.
 * @return The canonical absolute path of the file.
 */
Result<std::filesystem::path> validateFilePath(const std::filesystem::path& projectPath,
                                               const std::string& filePath);

/// Project-relative form of an existing file, forward slashes.
Result<std::string> normalizeFilePath(const std::filesystem::path& projectPath,
                                      const std::filesystem::path& filePath);

/// Lexical normalisation for paths that may no longer exist on disk. Rejects absolute
/// paths and paths that climb out of the project.
Result<std::string> normalizeRelativePath(const std::string& filePath);

/// Per-project metadata directory.
std::filesystem::path getDataDir(const std::filesystem::path& projectPath,
                                 const config::NexusConfig& config = {});

} // namespace codenexus::metadata
