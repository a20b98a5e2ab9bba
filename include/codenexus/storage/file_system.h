#pragma once

#include <filesystem>
#include <string>

namespace codenexus::storage {

/**
 * Existence oracle for project files. Managers consult it to gate mutations and to
 * drive cleanup of stale entries; file contents are never read.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // relativePath uses forward slashes and is relative to the project root
    virtual bool exists(const std::string& relativePath) const = 0;
};

// Resolves project-relative paths against a root directory on the local disk
class LocalFileSystem : public FileSystem {
public:
    explicit LocalFileSystem(std::filesystem::path root);

    bool exists(const std::string& relativePath) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace codenexus::storage
