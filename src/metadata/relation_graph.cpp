#include <codenexus/metadata/relation_graph.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace codenexus::metadata {

namespace {

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

RelationGraph::RelationGraph(std::shared_ptr<storage::SnapshotStore> store,
                             std::shared_ptr<storage::FileSystem> fileSystem)
    : store_(std::move(store)), fileSystem_(std::move(fileSystem)) {}

Result<void> RelationGraph::initialize() {
    auto snapshot = store_->loadRelations();
    if (!snapshot) {
        return withContext(snapshot.error(), "Failed to load relations");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    forward_.clear();
    for (const auto& [source, relations] : snapshot.value().fileRelations) {
        if (!relations.empty())
            forward_.emplace(source, relations);
    }
    rebuildReverseIndex();

    spdlog::info("Relation graph loaded {} source file(s)", forward_.size());
    return {};
}

Result<void> RelationGraph::addRelation(const std::string& source, const std::string& target,
                                        const std::string& description) {
    if (!fileSystem_->exists(source)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + source};
    }
    if (!fileSystem_->exists(target)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + target};
    }
    if (isBlank(description)) {
        return Error{ErrorCode::ConfigError, "Relation description must not be empty"};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = forward_.find(source);
    if (it != forward_.end()) {
        const bool exists = std::any_of(it->second.begin(), it->second.end(),
                                        [&](const Relation& r) { return r.target == target; });
        if (exists) {
            return Error{ErrorCode::RelationAlreadyExists,
                         "Relation already exists: " + source + " -> " + target};
        }
    }

    forward_[source].push_back(Relation{target, description});
    reverse_[target].push_back(IncomingRelation{source, description});

    if (auto saved = persist(); !saved) {
        auto& outgoing = forward_[source];
        outgoing.pop_back();
        if (outgoing.empty())
            forward_.erase(source);
        removeIncoming(source, target);
        return withContext(saved.error(), "Failed to save relation " + source + " -> " + target);
    }

    spdlog::info("Added relation {} -> {} ({})", source, target, description);
    return {};
}

Result<void> RelationGraph::removeRelation(const std::string& source, const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = forward_.find(source);
    if (it == forward_.end()) {
        return Error{ErrorCode::RelationNotFound,
                     "Relation not found: " + source + " -> " + target};
    }
    auto& outgoing = it->second;
    auto edge = std::find_if(outgoing.begin(), outgoing.end(),
                             [&](const Relation& r) { return r.target == target; });
    if (edge == outgoing.end()) {
        return Error{ErrorCode::RelationNotFound,
                     "Relation not found: " + source + " -> " + target};
    }

    const auto position = static_cast<std::size_t>(std::distance(outgoing.begin(), edge));
    const Relation removed = *edge;
    std::vector<IncomingRelation> previousIncoming;
    if (auto rev = reverse_.find(target); rev != reverse_.end())
        previousIncoming = rev->second;

    outgoing.erase(edge);
    if (outgoing.empty())
        forward_.erase(it);
    removeIncoming(source, target);

    if (auto saved = persist(); !saved) {
        auto& restored = forward_[source];
        restored.insert(restored.begin() + static_cast<std::ptrdiff_t>(position), removed);
        reverse_[target] = std::move(previousIncoming);
        return withContext(saved.error(),
                           "Failed to save removal of " + source + " -> " + target);
    }

    spdlog::info("Removed relation {} -> {}", source, target);
    return {};
}

std::vector<Relation> RelationGraph::getOutgoing(const std::string& filePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = forward_.find(filePath);
    if (it == forward_.end())
        return {};
    return it->second;
}

std::vector<IncomingRelation> RelationGraph::getIncoming(const std::string& filePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reverse_.find(filePath);
    if (it == reverse_.end())
        return {};
    return it->second;
}

std::vector<RelationMatch> RelationGraph::queryByDescription(const std::string& keyword) const {
    const std::string needle = toLowerAscii(keyword);

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RelationMatch> matches;
    for (const auto& [source, relations] : forward_) {
        for (const auto& relation : relations) {
            if (toLowerAscii(relation.description).find(needle) != std::string::npos) {
                matches.push_back(RelationMatch{source, relation});
            }
        }
    }
    // Edges of one source keep their insertion order
    std::stable_sort(matches.begin(), matches.end(),
                     [](const RelationMatch& a, const RelationMatch& b) { return a.source < b.source; });
    return matches;
}

std::map<std::string, std::vector<Relation>>
RelationGraph::getRelationGraph(const std::string& filePath, std::size_t maxDepth) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<Relation>> graph;
    expand(filePath, maxDepth, graph);
    return graph;
}

void RelationGraph::expand(const std::string& root, std::size_t maxDepth,
                           std::map<std::string, std::vector<Relation>>& graph) const {
    struct Frame {
        std::string node;
        std::size_t depth;
        std::vector<Relation> fresh;
        std::size_t next = 0;
    };

    std::unordered_set<std::string> visited;
    std::vector<Frame> stack;

    // Marks the node visited and pushes a frame when it has unvisited targets
    auto open = [&](const std::string& node, std::size_t depth) {
        if (depth >= maxDepth || !visited.insert(node).second)
            return;
        auto it = forward_.find(node);
        if (it == forward_.end())
            return;

        std::vector<Relation> fresh;
        for (const auto& relation : it->second) {
            if (visited.count(relation.target) == 0)
                fresh.push_back(relation);
        }
        if (!fresh.empty())
            stack.push_back(Frame{node, depth, std::move(fresh)});
    };

    open(root, 0);
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next < top.fresh.size()) {
            const std::string target = top.fresh[top.next++].target;
            const std::size_t depth = top.depth + 1;
            open(target, depth);
            continue;
        }
        graph.emplace(std::move(top.node), std::move(top.fresh));
        stack.pop_back();
    }
}

Result<std::size_t> RelationGraph::cleanupInvalidRelations() {
    std::lock_guard<std::mutex> lock(mutex_);

    const ForwardMap previous = forward_;
    std::size_t removedCount = 0;

    for (auto it = forward_.begin(); it != forward_.end();) {
        if (!fileSystem_->exists(it->first)) {
            removedCount += it->second.size();
            spdlog::debug("Dropping all relations of missing file {}", it->first);
            it = forward_.erase(it);
            continue;
        }

        auto& relations = it->second;
        const auto before = relations.size();
        relations.erase(std::remove_if(relations.begin(), relations.end(),
                                       [&](const Relation& r) {
                                           return !fileSystem_->exists(r.target);
                                       }),
                        relations.end());
        if (relations.size() != before) {
            removedCount += before - relations.size();
            spdlog::debug("Dropped {} relation(s) of {} to missing targets",
                          before - relations.size(), it->first);
        }

        if (relations.empty()) {
            it = forward_.erase(it);
        } else {
            ++it;
        }
    }

    if (removedCount == 0) {
        return removedCount;
    }

    rebuildReverseIndex();
    if (auto saved = persist(); !saved) {
        forward_ = previous;
        rebuildReverseIndex();
        return withContext(saved.error(), "Failed to save relation cleanup");
    }

    spdlog::info("Removed {} invalid relation(s)", removedCount);
    return removedCount;
}

bool RelationGraph::hasRelation(const std::string& source, const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = forward_.find(source);
    if (it == forward_.end())
        return false;
    return std::any_of(it->second.begin(), it->second.end(),
                       [&](const Relation& r) { return r.target == target; });
}

std::vector<std::string> RelationGraph::getRelatedFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(forward_.size());
    for (const auto& [source, relations] : forward_) {
        files.push_back(source);
    }
    std::sort(files.begin(), files.end());
    return files;
}

RelationGraphStats RelationGraph::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RelationGraphStats stats;
    stats.filesWithRelations = forward_.size();
    for (const auto& [source, relations] : forward_) {
        stats.totalRelations += relations.size();
    }
    stats.filesWithIncoming = reverse_.size();
    return stats;
}

void RelationGraph::rebuildReverseIndex() {
    reverse_.clear();
    for (const auto& [source, relations] : forward_) {
        for (const auto& relation : relations) {
            reverse_[relation.target].push_back(IncomingRelation{source, relation.description});
        }
    }
}

void RelationGraph::removeIncoming(const std::string& source, const std::string& target) {
    auto it = reverse_.find(target);
    if (it == reverse_.end())
        return;
    auto& incoming = it->second;
    incoming.erase(std::remove_if(incoming.begin(), incoming.end(),
                                  [&](const IncomingRelation& r) { return r.source == source; }),
                   incoming.end());
    if (incoming.empty())
        reverse_.erase(it);
}

Result<void> RelationGraph::persist() {
    storage::RelationsSnapshot snapshot;
    for (const auto& [source, relations] : forward_) {
        snapshot.fileRelations.emplace(source, relations);
    }
    return store_->saveRelations(snapshot);
}

} // namespace codenexus::metadata
