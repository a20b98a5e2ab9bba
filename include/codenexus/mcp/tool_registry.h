#pragma once

#include <nlohmann/json.hpp>
#include <codenexus/core/types.h>
#include <codenexus/mcp/error_handling.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codenexus::mcp {

using json = nlohmann::json;

[[maybe_unused]] static json wrapToolResult(const json& structured, bool isError = false) {
    // MCP content array with a single text item
    json result;
    result["content"] = json::array({json{{"type", "text"}, {"text", structured.dump()}}});
    if (isError) {
        result["isError"] = true;
    }
    return result;
}

// C++20 concepts for tool system
template <typename T>
concept ToolRequest = requires {
    typename T::RequestType;
    requires std::same_as<T, typename T::RequestType>;
};

template <typename T>
concept ToolResponse = requires {
    typename T::ResponseType;
    requires std::same_as<T, typename T::ResponseType>;
};

template <typename T>
concept ToolSerializable = requires(const T& t, const json& j) {
    { T::fromJson(j) } -> std::same_as<T>;
    { t.toJson() } -> std::same_as<json>;
};

// Tool request/response DTOs. Every request names the project it acts on.

// get_all_tags, get_system_status, cleanup_invalid_relations
struct MCPProjectRequest {
    using RequestType = MCPProjectRequest;

    std::string projectPath;

    static MCPProjectRequest fromJson(const json& j);
    json toJson() const;
};

// add_file_tags, remove_file_tags
struct MCPFileTagsRequest {
    using RequestType = MCPFileTagsRequest;

    std::string projectPath;
    std::string filePath;
    std::vector<std::string> tags;

    static MCPFileTagsRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPFileTagsResponse {
    using ResponseType = MCPFileTagsResponse;

    std::string filePath;
    std::vector<std::string> changed; // added or removed tags
    std::vector<std::string> tags;    // resulting tag set
    std::string message;

    static MCPFileTagsResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPQueryFilesByTagsRequest {
    using RequestType = MCPQueryFilesByTagsRequest;

    std::string projectPath;
    std::string query;

    static MCPQueryFilesByTagsRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPQueryFilesResponse {
    using ResponseType = MCPQueryFilesResponse;

    std::vector<std::string> files;
    size_t total = 0;

    static MCPQueryFilesResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPGetAllTagsResponse {
    using ResponseType = MCPGetAllTagsResponse;

    std::map<std::string, std::vector<std::string>> tagTypes;

    static MCPGetAllTagsResponse fromJson(const json& j);
    json toJson() const;
};

// add_file_comment, update_file_comment
struct MCPFileCommentRequest {
    using RequestType = MCPFileCommentRequest;

    std::string projectPath;
    std::string filePath;
    std::string comment;

    static MCPFileCommentRequest fromJson(const json& j);
    json toJson() const;
};

// add_file_relation, remove_file_relation (description ignored on removal)
struct MCPFileRelationRequest {
    using RequestType = MCPFileRelationRequest;

    std::string projectPath;
    std::string fromFile;
    std::string toFile;
    std::string description;

    static MCPFileRelationRequest fromJson(const json& j);
    json toJson() const;
};

// Plain acknowledgement for mutations with nothing else to report
struct MCPMessageResponse {
    using ResponseType = MCPMessageResponse;

    bool success = true;
    std::string message;

    static MCPMessageResponse fromJson(const json& j);
    json toJson() const;
};

// query_file_relations, query_incoming_relations, get_file_info
struct MCPFilePathRequest {
    using RequestType = MCPFilePathRequest;

    std::string projectPath;
    std::string filePath;

    static MCPFilePathRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPFileRelationsResponse {
    using ResponseType = MCPFileRelationsResponse;

    std::string filePath;
    bool incoming = false;
    // (peer file, description); the peer is the target for outgoing edges
    std::vector<std::pair<std::string, std::string>> relations;

    static MCPFileRelationsResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPRelationGraphRequest {
    using RequestType = MCPRelationGraphRequest;

    std::string projectPath;
    std::string filePath;
    std::optional<size_t> maxDepth;

    static MCPRelationGraphRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPRelationGraphResponse {
    using ResponseType = MCPRelationGraphResponse;

    std::string root;
    size_t maxDepth = 0;
    std::map<std::string, std::vector<Relation>> graph;

    static MCPRelationGraphResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPCleanupResponse {
    using ResponseType = MCPCleanupResponse;

    size_t removedRelations = 0;
    size_t removedComments = 0;

    static MCPCleanupResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPFileInfo {
    std::string path;
    std::vector<std::string> tags;
    std::optional<std::string> comment;
    std::vector<Relation> relations;
    std::vector<IncomingRelation> incomingRelations;

    static MCPFileInfo fromJson(const json& j);
    json toJson() const;
};

struct MCPFileInfoResponse {
    using ResponseType = MCPFileInfoResponse;

    MCPFileInfo info;

    static MCPFileInfoResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPSystemStatusResponse {
    using ResponseType = MCPSystemStatusResponse;

    size_t totalFiles = 0;
    size_t taggedFiles = 0;
    size_t commentedFiles = 0;
    size_t totalRelations = 0;
    std::map<std::string, std::vector<std::string>> tagTypes;
    size_t totalTags = 0;

    static MCPSystemStatusResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPKeywordRequest {
    using RequestType = MCPKeywordRequest;

    std::string projectPath;
    std::string keyword;

    static MCPKeywordRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPSearchFilesResponse {
    using ResponseType = MCPSearchFilesResponse;

    std::vector<MCPFileInfo> files;

    static MCPSearchFilesResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPQuerySuggestionsRequest {
    using RequestType = MCPQuerySuggestionsRequest;

    std::string projectPath;
    std::string partial;

    static MCPQuerySuggestionsRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPQuerySuggestionsResponse {
    using ResponseType = MCPQuerySuggestionsResponse;

    std::vector<std::string> suggestions;

    static MCPQuerySuggestionsResponse fromJson(const json& j);
    json toJson() const;
};

template <ToolRequest RequestType, ToolResponse ResponseType>
requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
class ToolWrapper {
public:
    using HandlerFn = std::function<Result<ResponseType>(const RequestType&)>;

    explicit ToolWrapper(HandlerFn handler) : handler_(std::move(handler)) {}

    json operator()(const json& args) const {
        try {
            auto req = RequestType::fromJson(args);
            auto result = handler_(req);

            if (!result) {
                return wrapToolResult(formatErrorResponse(result.error()), true);
            }

            return wrapToolResult(result.value().toJson(), false);
        } catch (const json::exception& e) {
            return wrapToolResult(
                formatErrorResponse(Error{ErrorCode::ConfigError,
                                          "Invalid arguments: " + std::string(e.what())}),
                true);
        } catch (const std::invalid_argument& e) {
            return wrapToolResult(
                formatErrorResponse(Error{ErrorCode::ConfigError,
                                          "Invalid arguments: " + std::string(e.what())}),
                true);
        } catch (const std::exception& e) {
            return wrapToolResult(
                formatErrorResponse(Error{ErrorCode::InternalError, e.what()}), true);
        }
    }

private:
    HandlerFn handler_;
};

class ToolRegistry {
public:
    using HandlerFn = std::function<json(const json&)>;

    ToolRegistry() { handlers_.reserve(32); }

    template <ToolRequest RequestType, ToolResponse ResponseType>
    requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
    void registerTool(std::string_view name,
                      std::function<Result<ResponseType>(const RequestType&)> handler,
                      json schema = {}, std::string description = {}) {
        auto wrapper = ToolWrapper<RequestType, ResponseType>(std::move(handler));
        auto [it, inserted] = handlers_.emplace(std::string(name), HandlerFn(std::move(wrapper)));
        if (inserted) {
            descriptors_.push_back(ToolDescriptor{it->first, std::move(schema), std::move(description)});
        }
    }

    json callTool(std::string_view name, const json& arguments) const {
        if (auto it = handlers_.find(std::string(name)); it != handlers_.end()) {
            return it->second(arguments);
        }
        return wrapToolResult(formatErrorResponse(Error{ErrorCode::ConfigError,
                                                        "Unknown tool: " + std::string(name)}),
                              true);
    }

    bool hasTool(std::string_view name) const {
        return handlers_.find(std::string(name)) != handlers_.end();
    }

    json listTools() const {
        json tools = json::array();
        for (const auto& desc : descriptors_) {
            json tool;
            tool["name"] = desc.name;
            tool["description"] = desc.description;
            tool["inputSchema"] = desc.schema.empty() ? json{{"type", "object"}} : desc.schema;
            tools.push_back(std::move(tool));
        }
        return json{{"tools", std::move(tools)}};
    }

    size_t size() const { return descriptors_.size(); }

private:
    struct ToolDescriptor {
        std::string name;
        json schema;
        std::string description;
    };

    std::unordered_map<std::string, HandlerFn> handlers_;
    std::vector<ToolDescriptor> descriptors_;
};

} // namespace codenexus::mcp
