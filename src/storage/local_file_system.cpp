#include <codenexus/storage/file_system.h>

#include <system_error>

namespace codenexus::storage {

LocalFileSystem::LocalFileSystem(std::filesystem::path root) : root_(std::move(root)) {}

bool LocalFileSystem::exists(const std::string& relativePath) const {
    if (relativePath.empty())
        return false;
    std::error_code ec;
    return std::filesystem::exists(root_ / std::filesystem::path(relativePath), ec) && !ec;
}

} // namespace codenexus::storage
