#include <codenexus/metadata/comment_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace codenexus::metadata {

namespace {

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

CommentStore::CommentStore(std::shared_ptr<storage::SnapshotStore> store,
                           std::shared_ptr<storage::FileSystem> fileSystem)
    : store_(std::move(store)), fileSystem_(std::move(fileSystem)) {}

Result<void> CommentStore::initialize() {
    auto snapshot = store_->loadComments();
    if (!snapshot) {
        return withContext(snapshot.error(), "Failed to load comments");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    comments_ = snapshot.value().fileComments;
    spdlog::info("Comment store loaded {} comment(s)", comments_.size());
    return {};
}

Result<void> CommentStore::validateInput(const std::string& filePath,
                                         const std::string& comment) const {
    if (!fileSystem_->exists(filePath)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + filePath};
    }
    if (comment.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error{ErrorCode::ConfigError, "Comment must not be empty"};
    }
    return {};
}

Result<void> CommentStore::addComment(const std::string& filePath, const std::string& comment) {
    if (auto r = validateInput(filePath, comment); !r)
        return r;

    std::lock_guard<std::mutex> lock(mutex_);
    if (comments_.count(filePath) > 0) {
        return Error{ErrorCode::ConfigError,
                     "File " + filePath + " already has a comment; update it instead"};
    }

    comments_.emplace(filePath, comment);
    if (auto saved = persist(); !saved) {
        comments_.erase(filePath);
        return withContext(saved.error(), "Failed to save comment for " + filePath);
    }

    spdlog::info("Added comment to {}", filePath);
    return {};
}

Result<void> CommentStore::updateComment(const std::string& filePath, const std::string& comment) {
    if (auto r = validateInput(filePath, comment); !r)
        return r;

    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<std::string> previous;
    if (auto it = comments_.find(filePath); it != comments_.end()) {
        previous = it->second;
    }

    comments_[filePath] = comment;
    if (auto saved = persist(); !saved) {
        if (previous) {
            comments_[filePath] = *previous;
        } else {
            comments_.erase(filePath);
        }
        return withContext(saved.error(), "Failed to save comment for " + filePath);
    }

    spdlog::info("{} comment of {}", previous ? "Updated" : "Added", filePath);
    return {};
}

Result<void> CommentStore::deleteComment(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = comments_.find(filePath);
    if (it == comments_.end()) {
        return Error{ErrorCode::FileNotFound, "File " + filePath + " has no comment"};
    }

    std::string previous = std::move(it->second);
    comments_.erase(it);
    if (auto saved = persist(); !saved) {
        comments_.emplace(filePath, std::move(previous));
        return withContext(saved.error(), "Failed to save comment removal for " + filePath);
    }

    spdlog::info("Deleted comment of {}", filePath);
    return {};
}

std::optional<std::string> CommentStore::getComment(const std::string& filePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = comments_.find(filePath);
    if (it == comments_.end())
        return std::nullopt;
    return it->second;
}

std::map<std::string, std::string>
CommentStore::getComments(const std::vector<std::string>& filePaths) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> out;
    for (const auto& path : filePaths) {
        if (auto it = comments_.find(path); it != comments_.end()) {
            out.emplace(path, it->second);
        }
    }
    return out;
}

bool CommentStore::hasComment(const std::string& filePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return comments_.count(filePath) > 0;
}

std::vector<std::string> CommentStore::getCommentedFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(comments_.size());
    for (const auto& [path, comment] : comments_) {
        files.push_back(path);
    }
    return files;
}

std::vector<std::pair<std::string, std::string>>
CommentStore::searchComments(const std::string& keyword) const {
    const std::string needle = toLowerAscii(keyword);

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, std::string>> matches;
    for (const auto& [path, comment] : comments_) {
        if (toLowerAscii(comment).find(needle) != std::string::npos) {
            matches.emplace_back(path, comment);
        }
    }
    return matches;
}

CommentStoreStats CommentStore::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CommentStoreStats stats;
    stats.commentedFiles = comments_.size();
    for (const auto& [path, comment] : comments_) {
        stats.totalChars += comment.size();
    }
    return stats;
}

Result<std::size_t> CommentStore::cleanupInvalidComments() {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto previous = comments_;
    std::size_t removed = 0;
    for (auto it = comments_.begin(); it != comments_.end();) {
        if (!fileSystem_->exists(it->first)) {
            spdlog::debug("Dropping comment of missing file {}", it->first);
            it = comments_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed == 0)
        return removed;

    if (auto saved = persist(); !saved) {
        comments_ = previous;
        return withContext(saved.error(), "Failed to save comment cleanup");
    }

    spdlog::info("Removed {} comment(s) of missing files", removed);
    return removed;
}

std::map<std::string, std::string> CommentStore::exportComments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return comments_;
}

Result<std::size_t>
CommentStore::importComments(const std::map<std::string, std::string>& comments) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto previous = comments_;
    std::size_t imported = 0;
    for (const auto& [path, comment] : comments) {
        if (auto valid = validateInput(path, comment); !valid) {
            spdlog::debug("Skipping imported comment for {}: {}", path, valid.error().message);
            continue;
        }
        comments_[path] = comment;
        ++imported;
    }

    if (imported == 0)
        return imported;

    if (auto saved = persist(); !saved) {
        comments_ = previous;
        return withContext(saved.error(), "Failed to save imported comments");
    }

    spdlog::info("Imported {} comment(s)", imported);
    return imported;
}

Result<void> CommentStore::persist() {
    storage::CommentsSnapshot snapshot;
    snapshot.fileComments = comments_;
    return store_->saveComments(snapshot);
}

} // namespace codenexus::metadata
