#pragma once

#include <codenexus/core/types.h>
#include <codenexus/storage/file_system.h>
#include <codenexus/storage/snapshot_store.h>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace codenexus::metadata {

struct TagIndexStats {
    std::size_t taggedFiles = 0;
    std::size_t distinctTags = 0;
    std::size_t tagTypes = 0;
};

/**
 * TagIndex owns file -> tag set plus two derived indices:
 *   tag type -> values in use, and full tag -> files carrying it.
 *
 * Every tag present in a derived index belongs to at least one file and vice versa;
 * entries are pruned the moment their last reference disappears. All operations take
 * one mutex. Mutations save a full snapshot before releasing it and restore the
 * previous in-memory state if the save fails.
 */
class TagIndex {
public:
    TagIndex(std::shared_ptr<storage::SnapshotStore> store,
             std::shared_ptr<storage::FileSystem> fileSystem);

    // Load the snapshot and rebuild the derived indices
    Result<void> initialize();

    // Exactly one ':' with a non-empty type and value
    static Result<void> validateTag(const std::string& tag);

    /**
     * Add tags to a file. Fails with FileNotFound when the file is missing and with
     * InvalidTagFormat before any change when a tag is malformed.
     * @return the tags that were not present before, in request order
     */
    Result<std::vector<std::string>> addTags(const std::string& filePath,
                                             const std::vector<std::string>& tags);

    /**
     * Remove tags from a file, all or nothing. FileNotFound when the file has no tags,
     * TagNotFound when any requested tag is missing.
     */
    Result<std::vector<std::string>> removeTags(const std::string& filePath,
                                                const std::vector<std::string>& tags);

    // Sorted; empty for unknown files
    std::vector<std::string> getFileTags(const std::string& filePath) const;

    // tag type -> sorted values
    std::map<std::string, std::vector<std::string>> getAllTags() const;

    Result<std::vector<std::string>> queryFilesByTags(const std::string& expression) const;

    // Exact lookup of one full tag, no query parsing; sorted
    std::vector<std::string> getFilesWithTag(const std::string& tag) const;

    TagIndexStats getStats() const;
    std::vector<std::string> getTaggedFiles() const;

private:
    void rebuildIndices();
    void indexTag(const std::string& tag, const std::string& filePath);
    void unindexTag(const std::string& tag, const std::string& filePath);
    Result<void> persist();

    std::shared_ptr<storage::SnapshotStore> store_;
    std::shared_ptr<storage::FileSystem> fileSystem_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::set<std::string>> fileTags_;
    std::unordered_map<std::string, std::set<std::string>> tagTypes_;
    std::unordered_map<std::string, std::set<std::string>> tagToFiles_;
};

} // namespace codenexus::metadata
