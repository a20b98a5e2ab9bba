#include <codenexus/app/services/metadata_query_service.hpp>
#include <codenexus/search/tag_query_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <set>

namespace codenexus::app::services {

MetadataQueryService::MetadataQueryService(std::shared_ptr<ProjectContext> context)
    : context_(std::move(context)) {}

Result<QueryResult> MetadataQueryService::executeTagQuery(const std::string& expression) const {
    auto files = context_->tags().queryFilesByTags(expression);
    if (!files) {
        return files.error();
    }
    QueryResult result;
    result.files = std::move(files).value();
    result.total = result.files.size();
    return result;
}

Result<FileInfo> MetadataQueryService::getFileInfo(const std::string& filePath) const {
    FileInfo info;
    info.path = filePath;
    info.tags = context_->tags().getFileTags(filePath);
    info.comment = context_->comments().getComment(filePath);
    info.relations = context_->relations().getOutgoing(filePath);
    info.incomingRelations = context_->relations().getIncoming(filePath);
    return info;
}

Result<QueryResult>
MetadataQueryService::executeComplexQuery(const std::optional<std::string>& tagQuery,
                                          const std::optional<std::string>& relationKeyword) const {
    std::set<std::string> files;

    if (tagQuery) {
        auto tagged = context_->tags().queryFilesByTags(*tagQuery);
        if (!tagged) {
            return tagged.error();
        }
        files.insert(tagged.value().begin(), tagged.value().end());
    }

    if (relationKeyword) {
        std::set<std::string> sources;
        for (const auto& match : context_->relations().queryByDescription(*relationKeyword)) {
            sources.insert(match.source);
        }
        if (tagQuery) {
            std::set<std::string> both;
            std::set_intersection(files.begin(), files.end(), sources.begin(), sources.end(),
                                  std::inserter(both, both.end()));
            files = std::move(both);
        } else {
            files = std::move(sources);
        }
    }

    QueryResult result;
    result.files.assign(files.begin(), files.end());
    result.total = result.files.size();
    return result;
}

Result<SystemStatus> MetadataQueryService::getSystemStatus() const {
    const auto tagStats = context_->tags().getStats();
    const auto commentStats = context_->comments().getStats();
    const auto relationStats = context_->relations().getStats();

    SystemStatus status;
    status.taggedFiles = tagStats.taggedFiles;
    status.commentedFiles = commentStats.commentedFiles;
    status.totalRelations = relationStats.totalRelations;
    status.totalFiles = std::max({tagStats.taggedFiles, commentStats.commentedFiles,
                                  relationStats.filesWithRelations});
    status.tagStats.tagTypes = context_->tags().getAllTags();
    status.tagStats.totalFiles = tagStats.taggedFiles;
    status.tagStats.totalTags = tagStats.distinctTags;
    return status;
}

Result<std::vector<FileInfo>> MetadataQueryService::searchFiles(const std::string& keyword) const {
    std::set<std::string> files;
    for (const auto& [path, comment] : context_->comments().searchComments(keyword)) {
        files.insert(path);
    }
    for (const auto& match : context_->relations().queryByDescription(keyword)) {
        files.insert(match.source);
    }

    std::vector<FileInfo> results;
    results.reserve(files.size());
    for (const auto& path : files) {
        auto info = getFileInfo(path);
        if (!info) {
            return info.error();
        }
        results.push_back(std::move(info).value());
    }
    spdlog::debug("Search '{}' matched {} file(s)", keyword, results.size());
    return results;
}

Result<std::vector<std::string>>
MetadataQueryService::getRelatedFiles(const std::string& filePath, std::size_t maxResults) const {
    std::set<std::string> related;

    for (const auto& tag : context_->tags().getFileTags(filePath)) {
        for (auto& file : context_->tags().getFilesWithTag(tag)) {
            related.insert(std::move(file));
        }
    }
    for (const auto& relation : context_->relations().getOutgoing(filePath)) {
        related.insert(relation.target);
    }
    for (const auto& incoming : context_->relations().getIncoming(filePath)) {
        related.insert(incoming.source);
    }
    related.erase(filePath);

    std::vector<std::string> out(related.begin(), related.end());
    if (out.size() > maxResults) {
        out.resize(maxResults);
    }
    return out;
}

Result<std::vector<FileInfo>>
MetadataQueryService::getBatchFileInfo(const std::vector<std::string>& filePaths) const {
    std::vector<FileInfo> results;
    results.reserve(filePaths.size());
    for (const auto& path : filePaths) {
        auto info = getFileInfo(path);
        if (!info) {
            spdlog::debug("Skipping {} in batch lookup: {}", path, info.error().message);
            continue;
        }
        results.push_back(std::move(info).value());
    }
    return results;
}

Result<void> MetadataQueryService::validateQuerySyntax(const std::string& expression) const {
    return search::TagQueryEngine::validateQuerySyntax(expression);
}

Result<std::vector<std::string>>
MetadataQueryService::getQuerySuggestions(const std::string& partial) const {
    std::vector<std::string> suggestions;
    if (partial.empty()) {
        return suggestions;
    }

    for (const auto& [type, values] : context_->tags().getAllTags()) {
        const bool typeMatches = type.rfind(partial, 0) == 0;
        for (const auto& value : values) {
            std::string tag = type + ":" + value;
            if (typeMatches || tag.find(partial) != std::string::npos) {
                suggestions.push_back(std::move(tag));
            }
        }
    }

    std::sort(suggestions.begin(), suggestions.end());
    if (suggestions.size() > context_->config().suggestionLimit) {
        suggestions.resize(context_->config().suggestionLimit);
    }
    return suggestions;
}

} // namespace codenexus::app::services
