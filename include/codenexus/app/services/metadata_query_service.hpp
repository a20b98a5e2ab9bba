#pragma once

#include <codenexus/app/services/project_context.hpp>
#include <codenexus/core/types.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codenexus::app::services {

// ===========================
// Response DTOs
// ===========================

struct QueryResult {
    std::vector<std::string> files;
    std::size_t total{0};
};

struct FileInfo {
    std::string path;
    std::vector<std::string> tags;
    std::optional<std::string> comment;
    std::vector<Relation> relations;
    std::vector<IncomingRelation> incomingRelations;
};

struct TagStats {
    std::map<std::string, std::vector<std::string>> tagTypes;
    std::size_t totalFiles{0};
    std::size_t totalTags{0};
};

struct SystemStatus {
    std::size_t totalFiles{0};
    std::size_t taggedFiles{0};
    std::size_t commentedFiles{0};
    std::size_t totalRelations{0};
    TagStats tagStats;
};

/**
 * MetadataQueryService: read-side queries that combine tags, comments and relations
 * of one project. Each manager is locked separately, so a combined answer may mix
 * states from before and after a concurrent write.
 */
class MetadataQueryService {
public:
    explicit MetadataQueryService(std::shared_ptr<ProjectContext> context);

    Result<QueryResult> executeTagQuery(const std::string& expression) const;

    // Does not require the file to exist; unknown files yield an empty FileInfo
    Result<FileInfo> getFileInfo(const std::string& filePath) const;

    /**
     * Tag expression and/or relation-description keyword. With both, only files
     * matching both are returned. Sorted, no duplicates.
     */
    Result<QueryResult> executeComplexQuery(const std::optional<std::string>& tagQuery,
                                            const std::optional<std::string>& relationKeyword) const;

    Result<SystemStatus> getSystemStatus() const;

    // Files whose comment or outgoing relation description contains keyword
    Result<std::vector<FileInfo>> searchFiles(const std::string& keyword) const;

    // Files sharing a tag with filePath plus its direct relation peers
    Result<std::vector<std::string>> getRelatedFiles(const std::string& filePath,
                                                     std::size_t maxResults) const;

    Result<std::vector<FileInfo>> getBatchFileInfo(const std::vector<std::string>& filePaths) const;

    Result<void> validateQuerySyntax(const std::string& expression) const;

    // Full tags whose type starts with partial or whose text contains it
    Result<std::vector<std::string>> getQuerySuggestions(const std::string& partial) const;

private:
    std::shared_ptr<ProjectContext> context_;
};

} // namespace codenexus::app::services
