#pragma once

#include <codenexus/core/types.h>
#include <codenexus/storage/file_system.h>
#include <codenexus/storage/snapshot_store.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codenexus::metadata {

struct RelationGraphStats {
    std::size_t filesWithRelations = 0;
    std::size_t totalRelations = 0;
    std::size_t filesWithIncoming = 0;
};

// Edge found by a description search, with the file it starts from
struct RelationMatch {
    std::string source;
    Relation relation;

    bool operator==(const RelationMatch&) const = default;
};

/**
 * Directed, described edges between project files.
 *
 * The forward map (source -> outgoing edges, insertion ordered) is authoritative; the
 * reverse map (target -> incoming edges) is derived from it and updated in the same
 * critical section. At most one edge exists per ordered (source, target) pair.
 * Self-loops are accepted.
 */
class RelationGraph {
public:
    RelationGraph(std::shared_ptr<storage::SnapshotStore> store,
                  std::shared_ptr<storage::FileSystem> fileSystem);

    Result<void> initialize();

    Result<void> addRelation(const std::string& source, const std::string& target,
                             const std::string& description);

    // Does not consult the file system, so edges of deleted files can be removed
    Result<void> removeRelation(const std::string& source, const std::string& target);

    std::vector<Relation> getOutgoing(const std::string& filePath) const;
    std::vector<IncomingRelation> getIncoming(const std::string& filePath) const;

    // Case-insensitive substring match on descriptions, ordered by source path
    std::vector<RelationMatch> queryByDescription(const std::string& keyword) const;

    /**
     * Depth-limited forward walk from filePath (depth 0). A node is expanded at most
     * once and only while its depth is below maxDepth. Its entry lists the edges whose
     * target had not been visited when it was expanded; nodes left with no such edge
     * are omitted.
     */
    std::map<std::string, std::vector<Relation>> getRelationGraph(const std::string& filePath,
                                                                  std::size_t maxDepth) const;

    /**
     * Drop every edge whose source or target no longer exists.
     * @return number of edges removed
     */
    Result<std::size_t> cleanupInvalidRelations();

    bool hasRelation(const std::string& source, const std::string& target) const;

    // Files with at least one outgoing edge, sorted
    std::vector<std::string> getRelatedFiles() const;

    RelationGraphStats getStats() const;

private:
    using ForwardMap = std::unordered_map<std::string, std::vector<Relation>>;

    void rebuildReverseIndex();
    void removeIncoming(const std::string& source, const std::string& target);
    // Iterative depth-first walk behind getRelationGraph
    void expand(const std::string& root, std::size_t maxDepth,
                std::map<std::string, std::vector<Relation>>& graph) const;
    Result<void> persist();

    std::shared_ptr<storage::SnapshotStore> store_;
    std::shared_ptr<storage::FileSystem> fileSystem_;

    mutable std::mutex mutex_;
    ForwardMap forward_;
    std::unordered_map<std::string, std::vector<IncomingRelation>> reverse_;
};

} // namespace codenexus::metadata
