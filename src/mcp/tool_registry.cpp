#include <codenexus/core/json_types.h>
#include <codenexus/mcp/tool_registry.h>

#include <cstdint>
#include <stdexcept>

namespace codenexus::mcp {

namespace {

std::vector<std::string> string_array(const json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                out.push_back(item.get<std::string>());
            }
        }
    }
    return out;
}

// Required arguments; json::out_of_range / type_error surface as invalid arguments
std::string required_string(const json& j, const char* key) {
    return j.at(key).get<std::string>();
}

std::vector<std::string> required_string_array(const json& j, const char* key) {
    return j.at(key).get<std::vector<std::string>>();
}

// Optional non-negative integer; std::invalid_argument surfaces as invalid arguments
std::optional<size_t> optional_count(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const auto& value = j[key];
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an integer");
    }
    const auto parsed = value.get<std::int64_t>();
    if (parsed < 0) {
        throw std::invalid_argument(std::string("'") + key + "' must not be negative");
    }
    return static_cast<size_t>(parsed);
}

std::map<std::string, std::vector<std::string>> tag_types_from_json(const json& j) {
    std::map<std::string, std::vector<std::string>> out;
    if (j.is_object()) {
        for (const auto& [type, values] : j.items()) {
            out[type] = values.get<std::vector<std::string>>();
        }
    }
    return out;
}

} // namespace

// MCPProjectRequest
MCPProjectRequest MCPProjectRequest::fromJson(const json& j) {
    MCPProjectRequest req;
    req.projectPath = required_string(j, "project_path");
    return req;
}

json MCPProjectRequest::toJson() const {
    return json{{"project_path", projectPath}};
}

// MCPFileTagsRequest
MCPFileTagsRequest MCPFileTagsRequest::fromJson(const json& j) {
    MCPFileTagsRequest req;
    req.projectPath = required_string(j, "project_path");
    req.filePath = required_string(j, "file_path");
    req.tags = required_string_array(j, "tags");
    return req;
}

json MCPFileTagsRequest::toJson() const {
    return json{{"project_path", projectPath}, {"file_path", filePath}, {"tags", tags}};
}

// MCPFileTagsResponse
MCPFileTagsResponse MCPFileTagsResponse::fromJson(const json& j) {
    MCPFileTagsResponse resp;
    resp.filePath = j.value("file_path", std::string{});
    resp.changed = string_array(j, "changed");
    resp.tags = string_array(j, "tags");
    resp.message = j.value("message", std::string{});
    return resp;
}

json MCPFileTagsResponse::toJson() const {
    return json{{"success", true},
                {"message", message},
                {"file_path", filePath},
                {"changed", changed},
                {"tags", tags}};
}

// MCPQueryFilesByTagsRequest
MCPQueryFilesByTagsRequest MCPQueryFilesByTagsRequest::fromJson(const json& j) {
    MCPQueryFilesByTagsRequest req;
    req.projectPath = required_string(j, "project_path");
    req.query = required_string(j, "query");
    return req;
}

json MCPQueryFilesByTagsRequest::toJson() const {
    return json{{"project_path", projectPath}, {"query", query}};
}

// MCPQueryFilesResponse
MCPQueryFilesResponse MCPQueryFilesResponse::fromJson(const json& j) {
    MCPQueryFilesResponse resp;
    resp.files = string_array(j, "files");
    resp.total = j.value("total", resp.files.size());
    return resp;
}

json MCPQueryFilesResponse::toJson() const {
    return json{{"files", files}, {"total", total}};
}

// MCPGetAllTagsResponse
MCPGetAllTagsResponse MCPGetAllTagsResponse::fromJson(const json& j) {
    MCPGetAllTagsResponse resp;
    if (j.contains("tag_types")) {
        resp.tagTypes = tag_types_from_json(j["tag_types"]);
    }
    return resp;
}

json MCPGetAllTagsResponse::toJson() const {
    return json{{"tag_types", tagTypes}};
}

// MCPFileCommentRequest
MCPFileCommentRequest MCPFileCommentRequest::fromJson(const json& j) {
    MCPFileCommentRequest req;
    req.projectPath = required_string(j, "project_path");
    req.filePath = required_string(j, "file_path");
    req.comment = j.value("comment", std::string{});
    return req;
}

json MCPFileCommentRequest::toJson() const {
    return json{{"project_path", projectPath}, {"file_path", filePath}, {"comment", comment}};
}

// MCPFileRelationRequest
MCPFileRelationRequest MCPFileRelationRequest::fromJson(const json& j) {
    MCPFileRelationRequest req;
    req.projectPath = required_string(j, "project_path");
    req.fromFile = required_string(j, "from_file");
    req.toFile = required_string(j, "to_file");
    req.description = j.value("description", std::string{});
    return req;
}

json MCPFileRelationRequest::toJson() const {
    json j{{"project_path", projectPath}, {"from_file", fromFile}, {"to_file", toFile}};
    if (!description.empty()) {
        j["description"] = description;
    }
    return j;
}

// MCPMessageResponse
MCPMessageResponse MCPMessageResponse::fromJson(const json& j) {
    MCPMessageResponse resp;
    resp.success = j.value("success", true);
    resp.message = j.value("message", std::string{});
    return resp;
}

json MCPMessageResponse::toJson() const {
    return json{{"success", success}, {"message", message}};
}

// MCPFilePathRequest
MCPFilePathRequest MCPFilePathRequest::fromJson(const json& j) {
    MCPFilePathRequest req;
    req.projectPath = required_string(j, "project_path");
    req.filePath = required_string(j, "file_path");
    return req;
}

json MCPFilePathRequest::toJson() const {
    return json{{"project_path", projectPath}, {"file_path", filePath}};
}

// MCPFileRelationsResponse
MCPFileRelationsResponse MCPFileRelationsResponse::fromJson(const json& j) {
    MCPFileRelationsResponse resp;
    resp.filePath = j.value("file_path", std::string{});
    resp.incoming = j.contains("incoming_relations");
    const char* key = resp.incoming ? "incoming_relations" : "relations";
    const char* peer = resp.incoming ? "source" : "target";
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& r : j[key]) {
            resp.relations.emplace_back(r.value(peer, std::string{}),
                                        r.value("description", std::string{}));
        }
    }
    return resp;
}

json MCPFileRelationsResponse::toJson() const {
    const char* peer = incoming ? "source" : "target";
    json arr = json::array();
    for (const auto& [file, description] : relations) {
        arr.push_back(json{{peer, file}, {"description", description}});
    }
    return json{{"file_path", filePath},
                {incoming ? "incoming_relations" : "relations", std::move(arr)},
                {"total", relations.size()}};
}

// MCPRelationGraphRequest
MCPRelationGraphRequest MCPRelationGraphRequest::fromJson(const json& j) {
    MCPRelationGraphRequest req;
    req.projectPath = required_string(j, "project_path");
    req.filePath = required_string(j, "file_path");
    req.maxDepth = optional_count(j, "max_depth");
    return req;
}

json MCPRelationGraphRequest::toJson() const {
    json j{{"project_path", projectPath}, {"file_path", filePath}};
    if (maxDepth) {
        j["max_depth"] = *maxDepth;
    }
    return j;
}

// MCPRelationGraphResponse
MCPRelationGraphResponse MCPRelationGraphResponse::fromJson(const json& j) {
    MCPRelationGraphResponse resp;
    resp.root = j.value("root", std::string{});
    resp.maxDepth = j.value("max_depth", size_t{0});
    if (j.contains("graph") && j["graph"].is_object()) {
        for (const auto& [file, edges] : j["graph"].items()) {
            resp.graph[file] = edges.get<std::vector<Relation>>();
        }
    }
    return resp;
}

json MCPRelationGraphResponse::toJson() const {
    json g = json::object();
    for (const auto& [file, edges] : graph) {
        g[file] = edges;
    }
    return json{{"root", root}, {"max_depth", maxDepth}, {"graph", std::move(g)}};
}

// MCPCleanupResponse
MCPCleanupResponse MCPCleanupResponse::fromJson(const json& j) {
    MCPCleanupResponse resp;
    resp.removedRelations = j.value("removed_relations", size_t{0});
    resp.removedComments = j.value("removed_comments", size_t{0});
    return resp;
}

json MCPCleanupResponse::toJson() const {
    return json{{"success", true},
                {"removed_relations", removedRelations},
                {"removed_comments", removedComments}};
}

// MCPFileInfo
MCPFileInfo MCPFileInfo::fromJson(const json& j) {
    MCPFileInfo info;
    info.path = j.value("path", std::string{});
    info.tags = string_array(j, "tags");
    if (j.contains("comment") && j["comment"].is_string()) {
        info.comment = j["comment"].get<std::string>();
    }
    if (j.contains("relations") && j["relations"].is_array()) {
        info.relations = j["relations"].get<std::vector<Relation>>();
    }
    if (j.contains("incoming_relations") && j["incoming_relations"].is_array()) {
        info.incomingRelations = j["incoming_relations"].get<std::vector<IncomingRelation>>();
    }
    return info;
}

json MCPFileInfo::toJson() const {
    return json{{"path", path},
                {"tags", tags},
                {"comment", comment ? json(*comment) : json(nullptr)},
                {"relations", relations},
                {"incoming_relations", incomingRelations}};
}

// MCPFileInfoResponse
MCPFileInfoResponse MCPFileInfoResponse::fromJson(const json& j) {
    MCPFileInfoResponse resp;
    resp.info = MCPFileInfo::fromJson(j);
    return resp;
}

json MCPFileInfoResponse::toJson() const {
    return info.toJson();
}

// MCPSystemStatusResponse
MCPSystemStatusResponse MCPSystemStatusResponse::fromJson(const json& j) {
    MCPSystemStatusResponse resp;
    resp.totalFiles = j.value("total_files", size_t{0});
    resp.taggedFiles = j.value("tagged_files", size_t{0});
    resp.commentedFiles = j.value("commented_files", size_t{0});
    resp.totalRelations = j.value("total_relations", size_t{0});
    if (j.contains("tag_stats") && j["tag_stats"].is_object()) {
        const auto& stats = j["tag_stats"];
        if (stats.contains("tag_types")) {
            resp.tagTypes = tag_types_from_json(stats["tag_types"]);
        }
        resp.totalTags = stats.value("total_tags", size_t{0});
    }
    return resp;
}

json MCPSystemStatusResponse::toJson() const {
    return json{{"total_files", totalFiles},
                {"tagged_files", taggedFiles},
                {"commented_files", commentedFiles},
                {"total_relations", totalRelations},
                {"tag_stats",
                 {{"tag_types", tagTypes}, {"total_files", taggedFiles}, {"total_tags", totalTags}}}};
}

// MCPKeywordRequest
MCPKeywordRequest MCPKeywordRequest::fromJson(const json& j) {
    MCPKeywordRequest req;
    req.projectPath = required_string(j, "project_path");
    req.keyword = required_string(j, "keyword");
    return req;
}

json MCPKeywordRequest::toJson() const {
    return json{{"project_path", projectPath}, {"keyword", keyword}};
}

// MCPSearchFilesResponse
MCPSearchFilesResponse MCPSearchFilesResponse::fromJson(const json& j) {
    MCPSearchFilesResponse resp;
    if (j.contains("files") && j["files"].is_array()) {
        for (const auto& f : j["files"]) {
            resp.files.push_back(MCPFileInfo::fromJson(f));
        }
    }
    return resp;
}

json MCPSearchFilesResponse::toJson() const {
    json arr = json::array();
    for (const auto& f : files) {
        arr.push_back(f.toJson());
    }
    return json{{"files", std::move(arr)}, {"total", files.size()}};
}

// MCPQuerySuggestionsRequest
MCPQuerySuggestionsRequest MCPQuerySuggestionsRequest::fromJson(const json& j) {
    MCPQuerySuggestionsRequest req;
    req.projectPath = required_string(j, "project_path");
    req.partial = j.value("partial_query", j.value("partial", std::string{}));
    return req;
}

json MCPQuerySuggestionsRequest::toJson() const {
    return json{{"project_path", projectPath}, {"partial_query", partial}};
}

// MCPQuerySuggestionsResponse
MCPQuerySuggestionsResponse MCPQuerySuggestionsResponse::fromJson(const json& j) {
    MCPQuerySuggestionsResponse resp;
    resp.suggestions = string_array(j, "suggestions");
    return resp;
}

json MCPQuerySuggestionsResponse::toJson() const {
    return json{{"suggestions", suggestions}};
}

} // namespace codenexus::mcp
