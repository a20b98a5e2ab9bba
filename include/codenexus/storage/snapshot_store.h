#pragma once

#include <codenexus/core/types.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codenexus::storage {

/**
 * Full-replace snapshot of the tag dataset: file path -> tag list.
 * Tag order carries no meaning; the TagIndex enforces set semantics.
 */
struct TagsSnapshot {
    std::map<std::string, std::vector<std::string>> fileTags;
};

/**
 * Full-replace snapshot of the relation dataset: source path -> outgoing edges.
 */
struct RelationsSnapshot {
    std::map<std::string, std::vector<Relation>> fileRelations;
};

/**
 * Full-replace snapshot of the comment dataset: file path -> comment text.
 */
struct CommentsSnapshot {
    std::map<std::string, std::string> fileComments;
};

/**
 * SnapshotStore persists one snapshot per logical dataset.
 *
 * load*() returns an empty snapshot when the backing store is absent or blank and a
 * SerializationError when it cannot be parsed. save*() replaces the whole dataset.
 * Implementations are not required to be thread-safe; each dataset is only touched
 * under the lock of the manager that owns it.
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual Result<TagsSnapshot> loadTags() = 0;
    virtual Result<void> saveTags(const TagsSnapshot& snapshot) = 0;

    virtual Result<RelationsSnapshot> loadRelations() = 0;
    virtual Result<void> saveRelations(const RelationsSnapshot& snapshot) = 0;

    virtual Result<CommentsSnapshot> loadComments() = 0;
    virtual Result<void> saveComments(const CommentsSnapshot& snapshot) = 0;
};

struct JsonSnapshotStoreOptions {
    // Copy the previous file to <name>.json.bak before each overwrite (best effort)
    bool backupOnWrite = true;
    // Indentation passed to json::dump; negative writes compact JSON
    int indent = 2;
};

/**
 * JSON file backed store: tags.json, relations.json and comments.json inside dataDir.
 */
class JsonSnapshotStore : public SnapshotStore {
public:
    static constexpr const char* kTagsFile = "tags.json";
    static constexpr const char* kRelationsFile = "relations.json";
    static constexpr const char* kCommentsFile = "comments.json";

    explicit JsonSnapshotStore(std::filesystem::path dataDir, JsonSnapshotStoreOptions options = {});

    // Create the data directory and empty dataset files where missing
    Result<void> initialize();
    bool isInitialized() const;

    Result<TagsSnapshot> loadTags() override;
    Result<void> saveTags(const TagsSnapshot& snapshot) override;

    Result<RelationsSnapshot> loadRelations() override;
    Result<void> saveRelations(const RelationsSnapshot& snapshot) override;

    Result<CommentsSnapshot> loadComments() override;
    Result<void> saveComments(const CommentsSnapshot& snapshot) override;

    const std::filesystem::path& dataDir() const { return dataDir_; }

private:
    std::filesystem::path dataDir_;
    JsonSnapshotStoreOptions options_;
};

} // namespace codenexus::storage
