#include <codenexus/metadata/tag_index.h>
#include <codenexus/search/tag_query_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace codenexus::metadata {

namespace {

std::string joinTags(const std::vector<std::string>& tags) {
    std::string out;
    for (const auto& tag : tags) {
        if (!out.empty())
            out += ", ";
        out += tag;
    }
    return out;
}

} // namespace

TagIndex::TagIndex(std::shared_ptr<storage::SnapshotStore> store,
                   std::shared_ptr<storage::FileSystem> fileSystem)
    : store_(std::move(store)), fileSystem_(std::move(fileSystem)) {}

Result<void> TagIndex::initialize() {
    auto snapshot = store_->loadTags();
    if (!snapshot) {
        return withContext(snapshot.error(), "Failed to load tags");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fileTags_.clear();
    for (const auto& [file, tags] : snapshot.value().fileTags) {
        if (tags.empty())
            continue;
        fileTags_[file].insert(tags.begin(), tags.end());
    }
    rebuildIndices();

    spdlog::info("Tag index loaded {} file(s), {} distinct tag(s)", fileTags_.size(),
                 tagToFiles_.size());
    return {};
}

Result<void> TagIndex::validateTag(const std::string& tag) {
    const auto colon = tag.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == tag.size() ||
        tag.find(':', colon + 1) != std::string::npos) {
        return Error{ErrorCode::InvalidTagFormat, "Invalid tag format: '" + tag + "'"};
    }
    return {};
}

Result<std::vector<std::string>> TagIndex::addTags(const std::string& filePath,
                                                   const std::vector<std::string>& tags) {
    if (!fileSystem_->exists(filePath)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + filePath};
    }
    for (const auto& tag : tags) {
        if (auto r = validateTag(tag); !r)
            return r.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const bool hadEntry = fileTags_.count(filePath) > 0;
    auto& fileTags = fileTags_[filePath];
    std::vector<std::string> added;
    for (const auto& tag : tags) {
        if (fileTags.insert(tag).second) {
            indexTag(tag, filePath);
            added.push_back(tag);
        }
    }

    if (added.empty()) {
        if (!hadEntry)
            fileTags_.erase(filePath);
        spdlog::debug("Tags of {} unchanged", filePath);
        return added;
    }

    if (auto saved = persist(); !saved) {
        for (const auto& tag : added) {
            fileTags_[filePath].erase(tag);
            unindexTag(tag, filePath);
        }
        if (fileTags_[filePath].empty())
            fileTags_.erase(filePath);
        return withContext(saved.error(), "Failed to save tags for " + filePath);
    }

    spdlog::info("Added {} tag(s) to {}: {}", added.size(), filePath, joinTags(added));
    return added;
}

Result<std::vector<std::string>> TagIndex::removeTags(const std::string& filePath,
                                                      const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = fileTags_.find(filePath);
    if (it == fileTags_.end()) {
        return Error{ErrorCode::FileNotFound, "File has no tags: " + filePath};
    }
    for (const auto& tag : tags) {
        if (it->second.count(tag) == 0) {
            return Error{ErrorCode::TagNotFound,
                         "Tag '" + tag + "' not found on file " + filePath};
        }
    }

    std::vector<std::string> removed;
    for (const auto& tag : tags) {
        if (it->second.erase(tag) > 0) {
            unindexTag(tag, filePath);
            removed.push_back(tag);
        }
    }
    if (removed.empty()) {
        return removed;
    }
    if (it->second.empty()) {
        fileTags_.erase(it);
    }

    if (auto saved = persist(); !saved) {
        auto& fileTags = fileTags_[filePath];
        for (const auto& tag : removed) {
            fileTags.insert(tag);
            indexTag(tag, filePath);
        }
        return withContext(saved.error(), "Failed to save tags for " + filePath);
    }

    spdlog::info("Removed {} tag(s) from {}: {}", removed.size(), filePath, joinTags(removed));
    return removed;
}

std::vector<std::string> TagIndex::getFileTags(const std::string& filePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fileTags_.find(filePath);
    if (it == fileTags_.end())
        return {};
    return {it->second.begin(), it->second.end()};
}

std::map<std::string, std::vector<std::string>> TagIndex::getAllTags() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<std::string>> out;
    for (const auto& [type, values] : tagTypes_) {
        out.emplace(type, std::vector<std::string>(values.begin(), values.end()));
    }
    return out;
}

Result<std::vector<std::string>> TagIndex::queryFilesByTags(const std::string& expression) const {
    std::lock_guard<std::mutex> lock(mutex_);
    search::TagQueryEngine engine(search::TagIndexView{tagToFiles_, fileTags_});
    return engine.execute(expression);
}

std::vector<std::string> TagIndex::getFilesWithTag(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tagToFiles_.find(tag);
    if (it == tagToFiles_.end())
        return {};
    return {it->second.begin(), it->second.end()};
}

TagIndexStats TagIndex::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return TagIndexStats{fileTags_.size(), tagToFiles_.size(), tagTypes_.size()};
}

std::vector<std::string> TagIndex::getTaggedFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(fileTags_.size());
    for (const auto& [file, tags] : fileTags_) {
        files.push_back(file);
    }
    std::sort(files.begin(), files.end());
    return files;
}

void TagIndex::rebuildIndices() {
    tagTypes_.clear();
    tagToFiles_.clear();
    for (const auto& [file, tags] : fileTags_) {
        for (const auto& tag : tags) {
            indexTag(tag, file);
        }
    }
}

void TagIndex::indexTag(const std::string& tag, const std::string& filePath) {
    if (const auto colon = tag.find(':'); colon != std::string::npos) {
        tagTypes_[tag.substr(0, colon)].insert(tag.substr(colon + 1));
    }
    tagToFiles_[tag].insert(filePath);
}

void TagIndex::unindexTag(const std::string& tag, const std::string& filePath) {
    auto it = tagToFiles_.find(tag);
    if (it == tagToFiles_.end())
        return;
    it->second.erase(filePath);
    if (!it->second.empty())
        return;
    tagToFiles_.erase(it);

    // Last file carrying the tag is gone; drop the value from its type
    if (const auto colon = tag.find(':'); colon != std::string::npos) {
        auto typeIt = tagTypes_.find(tag.substr(0, colon));
        if (typeIt != tagTypes_.end()) {
            typeIt->second.erase(tag.substr(colon + 1));
            if (typeIt->second.empty())
                tagTypes_.erase(typeIt);
        }
    }
}

Result<void> TagIndex::persist() {
    storage::TagsSnapshot snapshot;
    for (const auto& [file, tags] : fileTags_) {
        snapshot.fileTags.emplace(file, std::vector<std::string>(tags.begin(), tags.end()));
    }
    return store_->saveTags(snapshot);
}

} // namespace codenexus::metadata
