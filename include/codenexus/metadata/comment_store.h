#pragma once

#include <codenexus/core/types.h>
#include <codenexus/storage/file_system.h>
#include <codenexus/storage/snapshot_store.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codenexus::metadata {

struct CommentStoreStats {
    std::size_t commentedFiles = 0;
    std::size_t totalChars = 0;
};

/**
 * One free-text comment per file, persisted through the snapshot store.
 */
class CommentStore {
public:
    CommentStore(std::shared_ptr<storage::SnapshotStore> store,
                 std::shared_ptr<storage::FileSystem> fileSystem);

    Result<void> initialize();

    // ConfigError when the file already has a comment; use updateComment instead
    Result<void> addComment(const std::string& filePath, const std::string& comment);

    // Insert or replace
    Result<void> updateComment(const std::string& filePath, const std::string& comment);

    Result<void> deleteComment(const std::string& filePath);

    std::optional<std::string> getComment(const std::string& filePath) const;

    // Only files that have a comment appear in the result
    std::map<std::string, std::string> getComments(const std::vector<std::string>& filePaths) const;

    bool hasComment(const std::string& filePath) const;
    std::vector<std::string> getCommentedFiles() const;

    // Case-insensitive substring match, ordered by path
    std::vector<std::pair<std::string, std::string>> searchComments(const std::string& keyword) const;

    CommentStoreStats getStats() const;

    Result<std::size_t> cleanupInvalidComments();

    // Copy of every stored comment keyed by path
    std::map<std::string, std::string> exportComments() const;

    /**
     * Insert or replace comments in bulk. Entries whose file is missing or whose
     * comment is blank are skipped. Saves once and returns the number imported.
     */
    Result<std::size_t> importComments(const std::map<std::string, std::string>& comments);

private:
    Result<void> validateInput(const std::string& filePath, const std::string& comment) const;
    Result<void> persist();

    std::shared_ptr<storage::SnapshotStore> store_;
    std::shared_ptr<storage::FileSystem> fileSystem_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> comments_;
};

} // namespace codenexus::metadata
