#pragma once

#include <codenexus/config/config_helpers.h>
#include <codenexus/core/types.h>
#include <codenexus/metadata/comment_store.h>
#include <codenexus/metadata/relation_graph.h>
#include <codenexus/metadata/tag_index.h>
#include <codenexus/storage/file_system.h>
#include <codenexus/storage/snapshot_store.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace codenexus::app::services {

/**
 * ProjectContext: the managers of one project root.
 *
 * TagIndex, RelationGraph and CommentStore share one snapshot store and one file
 * system view. Each manager has its own lock; reads that span managers are not
 * atomic across them.
 */
class ProjectContext {
public:
    ProjectContext(std::filesystem::path root, config::NexusConfig config,
                   std::shared_ptr<storage::SnapshotStore> store,
                   std::shared_ptr<storage::FileSystem> fileSystem);

    /**
     * Validate the project root, prepare <root>/<data_dir_name> and load every dataset.
     */
    static Result<std::shared_ptr<ProjectContext>> create(const std::string& projectPath,
                                                          const config::NexusConfig& config);

    // Load all datasets into the managers
    Result<void> initialize();

    const std::filesystem::path& root() const { return root_; }
    const config::NexusConfig& config() const { return config_; }

    metadata::TagIndex& tags() { return tags_; }
    const metadata::TagIndex& tags() const { return tags_; }
    metadata::RelationGraph& relations() { return relations_; }
    const metadata::RelationGraph& relations() const { return relations_; }
    metadata::CommentStore& comments() { return comments_; }
    const metadata::CommentStore& comments() const { return comments_; }

    // Project-relative key of a file that must exist inside the project
    Result<std::string> resolveExistingFile(const std::string& filePath) const;

    // Project-relative key of a file that may already be gone
    Result<std::string> resolveFileKey(const std::string& filePath) const;

private:
    std::filesystem::path root_;
    config::NexusConfig config_;
    std::shared_ptr<storage::SnapshotStore> store_;
    std::shared_ptr<storage::FileSystem> fileSystem_;

    metadata::TagIndex tags_;
    metadata::RelationGraph relations_;
    metadata::CommentStore comments_;
};

/**
 * ProjectRegistry: lazily created contexts keyed by canonical project path.
 *
 * Lookup and creation happen under one hold of the registry lock, so concurrent first
 * requests for the same path build exactly one context.
 */
class ProjectRegistry {
public:
    explicit ProjectRegistry(config::NexusConfig config = {});

    Result<std::shared_ptr<ProjectContext>> getOrCreate(const std::string& projectPath);

    std::size_t size() const;
    const config::NexusConfig& config() const { return config_; }

private:
    config::NexusConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ProjectContext>> projects_;
};

} // namespace codenexus::app::services
