#include <codenexus/core/format.h>
#include <codenexus/mcp/mcp_server.h>
#include <codenexus/version.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <utility>

namespace codenexus::mcp {

using app::services::MetadataQueryService;
using app::services::ProjectContext;

namespace {

json createResponse(const json& id, const json& result) {
    return json{{"jsonrpc", std::string(protocol::JSONRPC_VERSION)}, {"id", id}, {"result", result}};
}

json createError(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", std::string(protocol::JSONRPC_VERSION)},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

spdlog::level::level_enum parseMcpLogLevel(const std::string& level) {
    if (level == "warning")
        return spdlog::level::warn;
    if (level == "notice")
        return spdlog::level::info;
    if (level == "alert" || level == "emergency")
        return spdlog::level::critical;
    // from_str maps unknown names to off
    auto parsed = spdlog::level::from_str(level);
    return parsed == spdlog::level::off && level != "off" ? spdlog::level::info : parsed;
}

// JSON Schema helpers for tools/list
json stringProp(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

json objectSchema(json properties, std::vector<std::string> required) {
    return json{{"type", "object"}, {"properties", std::move(properties)}, {"required", required}};
}

const json& projectPathProp() {
    static const json prop =
        stringProp("Absolute path of the project root; metadata lives under <root>/.codenexus");
    return prop;
}

MCPFileInfo toMcpFileInfo(app::services::FileInfo info) {
    MCPFileInfo out;
    out.path = std::move(info.path);
    out.tags = std::move(info.tags);
    out.comment = std::move(info.comment);
    out.relations = std::move(info.relations);
    out.incomingRelations = std::move(info.incomingRelations);
    return out;
}

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     std::shared_ptr<app::services::ProjectRegistry> projects,
                     std::atomic<bool>* externalShutdown)
    : transport_(std::move(transport)), projects_(std::move(projects)),
      externalShutdown_(externalShutdown) {
    serverInfo_.version = CODENEXUS_VERSION_STRING;
    if (auto* stdio = dynamic_cast<StdioTransport*>(transport_.get())) {
        stdio->setShutdownFlag(externalShutdown_);
    }
    registerTools();
    spdlog::debug("MCP server registered {} tools", toolRegistry_.size());
}

MCPServer::~MCPServer() {
    stop();
}

void MCPServer::start() {
    if (running_.exchange(true)) {
        return;
    }
#ifndef _WIN32
    // A client closing its read end must not kill the process mid-write
    std::signal(SIGPIPE, SIG_IGN);
#endif

    spdlog::info("MCP server started ({} {})", serverInfo_.name, serverInfo_.version);

    while (running_ && (!externalShutdown_ || !externalShutdown_->load())) {
        auto messageResult = transport_->receive();
        if (!messageResult) {
            const auto& error = messageResult.error();
            if (!transport_->isConnected()) {
                spdlog::debug("Transport closed: {}", error.message);
                break;
            }
            if (error.code == ErrorCode::SerializationError) {
                spdlog::debug("Invalid JSON received: {}", error.message);
                transport_->send(createError(json(nullptr), protocol::PARSE_ERROR, error.message));
                continue;
            }
            spdlog::error("Unexpected transport error: {}", error.message);
            continue;
        }

        const auto& message = messageResult.value();
        if (message.is_array()) {
            json responses = json::array();
            for (const auto& entry : message) {
                if (auto response = handleRequest(entry)) {
                    responses.push_back(std::move(*response));
                }
            }
            if (!responses.empty()) {
                transport_->send(responses);
            }
        } else if (auto response = handleRequest(message)) {
            transport_->send(*response);
        }
    }

    running_ = false;
    spdlog::info("MCP server stopped");
}

void MCPServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (transport_) {
        transport_->close();
    }
}

std::optional<json> MCPServer::handleRequest(const json& request) {
    auto valid = json_utils::validate_jsonrpc_message(request);
    if (!valid) {
        spdlog::warn("Rejected JSON-RPC message: {}", valid.error().message);
        json id = request.is_object() && request.contains("id") ? request["id"] : json(nullptr);
        return createError(id, protocol::INVALID_REQUEST, valid.error().message);
    }

    const bool isNotification = !request.contains("id");
    const json id = isNotification ? json(nullptr) : request["id"];
    const std::string method = request["method"].get<std::string>();
    const json params = request.value("params", json::object());

    spdlog::debug("MCP request: method={} id={}", method, id.dump());

    if (isNotification) {
        if (method == protocol::METHOD_INITIALIZED) {
            initialized_ = true;
            spdlog::debug("Client completed initialization");
        } else if (method == protocol::METHOD_EXIT) {
            stop();
        } else {
            spdlog::debug("Ignoring notification {}", method);
        }
        return std::nullopt;
    }

    if (method == protocol::METHOD_INITIALIZE) {
        return createResponse(id, initialize(params));
    }

    auto result = dispatchCoreMethod(method, params);
    if (!result) {
        const auto& error = result.error();
        const int code = error.code == ErrorCode::ConfigError ? protocol::INVALID_PARAMS
                         : error.code == ErrorCode::InternalError &&
                                 error.message.rfind("Method not found", 0) == 0
                             ? protocol::METHOD_NOT_FOUND
                             : protocol::INTERNAL_ERROR;
        return createError(id, code, error.message);
    }
    return createResponse(id, result.value());
}

json MCPServer::initialize(const json& params) {
    std::string requested = std::string(protocol::PROTOCOL_VERSION);
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    // Only one protocol revision is implemented; answer with it regardless
    negotiatedProtocolVersion_ = std::string(protocol::PROTOCOL_VERSION);
    if (requested != negotiatedProtocolVersion_) {
        spdlog::debug("Client requested protocol {}, using {}", requested,
                      negotiatedProtocolVersion_);
    }

    if (params.is_object() && params.contains("clientInfo")) {
        const auto& client = params["clientInfo"];
        spdlog::info("MCP client: {} {}", client.value("name", "unknown"),
                     client.value("version", "unknown"));
    }

    return json{{"protocolVersion", negotiatedProtocolVersion_},
                {"serverInfo", {{"name", serverInfo_.name}, {"version", serverInfo_.version}}},
                {"capabilities", {{"tools", json::object()}, {"logging", json::object()}}}};
}

Result<json> MCPServer::dispatchCoreMethod(const std::string& method, const json& params) {
    if (method == protocol::METHOD_PING) {
        return json::object();
    }

    if (method == protocol::METHOD_TOOLS_LIST) {
        return toolRegistry_.listTools();
    }

    if (method == protocol::METHOD_TOOLS_CALL) {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return Error{ErrorCode::ConfigError, "tools/call requires a string 'name'"};
        }
        const auto name = params["name"].get<std::string>();
        const json arguments = params.value("arguments", json::object());
        return callTool(name, arguments);
    }

    if (method == protocol::METHOD_LOGGING_SET_LEVEL) {
        if (!params.is_object() || !params.contains("level") || !params["level"].is_string()) {
            return Error{ErrorCode::ConfigError, "logging/setLevel requires a string 'level'"};
        }
        const auto level = params["level"].get<std::string>();
        spdlog::set_level(parseMcpLogLevel(level));
        spdlog::info("Log level set to {}", level);
        return json::object();
    }

    if (method == protocol::METHOD_SHUTDOWN) {
        spdlog::debug("Shutdown request received");
        return json::object();
    }

    if (method == protocol::METHOD_EXIT) {
        stop();
        return json::object();
    }

    return Error{ErrorCode::InternalError, codenexus::format("Method not found: {}", method)};
}

json MCPServer::callTool(const std::string& name, const json& arguments) {
    spdlog::debug("Calling tool {} with {}", name, arguments.dump());
    return toolRegistry_.callTool(name, arguments);
}

Result<std::shared_ptr<ProjectContext>> MCPServer::openProject(const std::string& path) {
    auto context = projects_->getOrCreate(path);
    if (!context) {
        spdlog::warn("Cannot open project '{}': {}", path, context.error().message);
    }
    return context;
}

void MCPServer::registerTools() {
    toolRegistry_.registerTool<MCPFileTagsRequest, MCPFileTagsResponse>(
        "add_file_tags", [this](const MCPFileTagsRequest& req) { return handleAddFileTags(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"file_path", stringProp("File to tag, absolute or project-relative")},
                      {"tags",
                       {{"type", "array"},
                        {"items", {{"type", "string"}}},
                        {"description", "Tags in type:value form, e.g. category:api"}}}},
                     {"project_path", "file_path", "tags"}),
        "Add type:value tags to a file");

    toolRegistry_.registerTool<MCPFileTagsRequest, MCPFileTagsResponse>(
        "remove_file_tags",
        [this](const MCPFileTagsRequest& req) { return handleRemoveFileTags(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"file_path", stringProp("File to untag")},
                      {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}}},
                     {"project_path", "file_path", "tags"}),
        "Remove tags from a file; fails without changes if any tag is not present");

    toolRegistry_.registerTool<MCPQueryFilesByTagsRequest, MCPQueryFilesResponse>(
        "query_files_by_tags",
        [this](const MCPQueryFilesByTagsRequest& req) { return handleQueryFilesByTags(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"query", stringProp("Tag expression with AND, OR, NOT, parentheses and "
                                           "* wildcards, e.g. 'lang:rust AND NOT status:*'")}},
                     {"project_path", "query"}),
        "Find files whose tags match a boolean tag expression");

    toolRegistry_.registerTool<MCPProjectRequest, MCPGetAllTagsResponse>(
        "get_all_tags", [this](const MCPProjectRequest& req) { return handleGetAllTags(req); },
        objectSchema({{"project_path", projectPathProp()}}, {"project_path"}),
        "List every tag in use, grouped by type");

    toolRegistry_.registerTool<MCPFileCommentRequest, MCPMessageResponse>(
        "add_file_comment",
        [this](const MCPFileCommentRequest& req) { return handleAddFileComment(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"file_path", stringProp("File to describe")},
                      {"comment", stringProp("Free-form description of the file")}},
                     {"project_path", "file_path", "comment"}),
        "Attach a comment to a file that has none yet");

    toolRegistry_.registerTool<MCPFileCommentRequest, MCPMessageResponse>(
        "update_file_comment",
        [this](const MCPFileCommentRequest& req) { return handleUpdateFileComment(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"file_path", stringProp("File to describe")},
                      {"comment", stringProp("Replacement comment")}},
                     {"project_path", "file_path", "comment"}),
        "Set or replace the comment of a file");

    toolRegistry_.registerTool<MCPFileRelationRequest, MCPMessageResponse>(
        "add_file_relation",
        [this](const MCPFileRelationRequest& req) { return handleAddFileRelation(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"from_file", stringProp("Source file")},
                      {"to_file", stringProp("Target file")},
                      {"description", stringProp("How the source relates to the target")}},
                     {"project_path", "from_file", "to_file", "description"}),
        "Record a described, directed relation between two files");

    toolRegistry_.registerTool<MCPFileRelationRequest, MCPMessageResponse>(
        "remove_file_relation",
        [this](const MCPFileRelationRequest& req) { return handleRemoveFileRelation(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"from_file", stringProp("Source file")},
                      {"to_file", stringProp("Target file")}},
                     {"project_path", "from_file", "to_file"}),
        "Remove the relation from one file to another");

    toolRegistry_.registerTool<MCPFilePathRequest, MCPFileRelationsResponse>(
        "query_file_relations",
        [this](const MCPFilePathRequest& req) { return handleQueryFileRelations(req); },
        objectSchema({{"project_path", projectPathProp()}, {"file_path", stringProp("File")}},
                     {"project_path", "file_path"}),
        "List relations going out of a file");

    toolRegistry_.registerTool<MCPFilePathRequest, MCPFileRelationsResponse>(
        "query_incoming_relations",
        [this](const MCPFilePathRequest& req) { return handleQueryIncomingRelations(req); },
        objectSchema({{"project_path", projectPathProp()}, {"file_path", stringProp("File")}},
                     {"project_path", "file_path"}),
        "List relations pointing at a file");

    toolRegistry_.registerTool<MCPRelationGraphRequest, MCPRelationGraphResponse>(
        "get_relation_graph",
        [this](const MCPRelationGraphRequest& req) { return handleGetRelationGraph(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"file_path", stringProp("Start file")},
                      {"max_depth",
                       {{"type", "integer"},
                        {"minimum", 0},
                        {"description", "Levels to expand from the start file"}}}},
                     {"project_path", "file_path"}),
        "Walk outgoing relations from a file up to a depth limit");

    toolRegistry_.registerTool<MCPProjectRequest, MCPCleanupResponse>(
        "cleanup_invalid_relations",
        [this](const MCPProjectRequest& req) { return handleCleanupInvalidRelations(req); },
        objectSchema({{"project_path", projectPathProp()}}, {"project_path"}),
        "Drop relations and comments that refer to files no longer on disk");

    toolRegistry_.registerTool<MCPFilePathRequest, MCPFileInfoResponse>(
        "get_file_info", [this](const MCPFilePathRequest& req) { return handleGetFileInfo(req); },
        objectSchema({{"project_path", projectPathProp()}, {"file_path", stringProp("File")}},
                     {"project_path", "file_path"}),
        "Tags, comment and relations of one file");

    toolRegistry_.registerTool<MCPProjectRequest, MCPSystemStatusResponse>(
        "get_system_status",
        [this](const MCPProjectRequest& req) { return handleGetSystemStatus(req); },
        objectSchema({{"project_path", projectPathProp()}}, {"project_path"}),
        "Counts of tagged, commented and related files");

    toolRegistry_.registerTool<MCPKeywordRequest, MCPSearchFilesResponse>(
        "search_files", [this](const MCPKeywordRequest& req) { return handleSearchFiles(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"keyword", stringProp("Case-insensitive text to look for")}},
                     {"project_path", "keyword"}),
        "Find files whose comment or relation descriptions mention a keyword");

    toolRegistry_.registerTool<MCPQuerySuggestionsRequest, MCPQuerySuggestionsResponse>(
        "get_query_suggestions",
        [this](const MCPQuerySuggestionsRequest& req) { return handleGetQuerySuggestions(req); },
        objectSchema({{"project_path", projectPathProp()},
                      {"partial_query", stringProp("Beginning of a tag or tag type")}},
                     {"project_path", "partial_query"}),
        "Suggest existing tags for a partial query term");
}

Result<MCPFileTagsResponse> MCPServer::handleAddFileTags(const MCPFileTagsRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveExistingFile(req.filePath);
    if (!key)
        return key.error();

    auto added = ctx.value()->tags().addTags(key.value(), req.tags);
    if (!added)
        return added.error();

    MCPFileTagsResponse resp;
    resp.filePath = key.value();
    resp.changed = std::move(added).value();
    resp.tags = ctx.value()->tags().getFileTags(key.value());
    resp.message = resp.changed.empty()
                       ? codenexus::format("{} already has all requested tags", resp.filePath)
                       : codenexus::format("Added {} tag(s) to {}", resp.changed.size(),
                                           resp.filePath);
    return resp;
}

Result<MCPFileTagsResponse> MCPServer::handleRemoveFileTags(const MCPFileTagsRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveFileKey(req.filePath);
    if (!key)
        return key.error();

    auto removed = ctx.value()->tags().removeTags(key.value(), req.tags);
    if (!removed)
        return removed.error();

    MCPFileTagsResponse resp;
    resp.filePath = key.value();
    resp.changed = std::move(removed).value();
    resp.tags = ctx.value()->tags().getFileTags(key.value());
    resp.message =
        codenexus::format("Removed {} tag(s) from {}", resp.changed.size(), resp.filePath);
    return resp;
}

Result<MCPQueryFilesResponse>
MCPServer::handleQueryFilesByTags(const MCPQueryFilesByTagsRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();

    MetadataQueryService service(ctx.value());
    auto result = service.executeTagQuery(req.query);
    if (!result)
        return result.error();

    MCPQueryFilesResponse resp;
    resp.files = result.value().files;
    resp.total = result.value().total;
    return resp;
}

Result<MCPGetAllTagsResponse> MCPServer::handleGetAllTags(const MCPProjectRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();

    MCPGetAllTagsResponse resp;
    resp.tagTypes = ctx.value()->tags().getAllTags();
    return resp;
}

Result<MCPMessageResponse> MCPServer::handleAddFileComment(const MCPFileCommentRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveExistingFile(req.filePath);
    if (!key)
        return key.error();

    if (auto r = ctx.value()->comments().addComment(key.value(), req.comment); !r)
        return r.error();
    return MCPMessageResponse{true, codenexus::format("Added comment to {}", key.value())};
}

Result<MCPMessageResponse> MCPServer::handleUpdateFileComment(const MCPFileCommentRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveExistingFile(req.filePath);
    if (!key)
        return key.error();

    if (auto r = ctx.value()->comments().updateComment(key.value(), req.comment); !r)
        return r.error();
    return MCPMessageResponse{true, codenexus::format("Updated comment of {}", key.value())};
}

Result<MCPMessageResponse> MCPServer::handleAddFileRelation(const MCPFileRelationRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto from = ctx.value()->resolveExistingFile(req.fromFile);
    if (!from)
        return from.error();
    auto to = ctx.value()->resolveExistingFile(req.toFile);
    if (!to)
        return to.error();

    if (auto r = ctx.value()->relations().addRelation(from.value(), to.value(), req.description);
        !r)
        return r.error();
    return MCPMessageResponse{
        true, codenexus::format("Added relation {} -> {}", from.value(), to.value())};
}

Result<MCPMessageResponse>
MCPServer::handleRemoveFileRelation(const MCPFileRelationRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto from = ctx.value()->resolveFileKey(req.fromFile);
    if (!from)
        return from.error();
    auto to = ctx.value()->resolveFileKey(req.toFile);
    if (!to)
        return to.error();

    if (auto r = ctx.value()->relations().removeRelation(from.value(), to.value()); !r)
        return r.error();
    return MCPMessageResponse{
        true, codenexus::format("Removed relation {} -> {}", from.value(), to.value())};
}

Result<MCPFileRelationsResponse>
MCPServer::handleQueryFileRelations(const MCPFilePathRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveFileKey(req.filePath);
    if (!key)
        return key.error();

    MCPFileRelationsResponse resp;
    resp.filePath = key.value();
    resp.incoming = false;
    for (auto& rel : ctx.value()->relations().getOutgoing(key.value())) {
        resp.relations.emplace_back(std::move(rel.target), std::move(rel.description));
    }
    return resp;
}

Result<MCPFileRelationsResponse>
MCPServer::handleQueryIncomingRelations(const MCPFilePathRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveFileKey(req.filePath);
    if (!key)
        return key.error();

    MCPFileRelationsResponse resp;
    resp.filePath = key.value();
    resp.incoming = true;
    for (auto& rel : ctx.value()->relations().getIncoming(key.value())) {
        resp.relations.emplace_back(std::move(rel.source), std::move(rel.description));
    }
    return resp;
}

Result<MCPRelationGraphResponse>
MCPServer::handleGetRelationGraph(const MCPRelationGraphRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveFileKey(req.filePath);
    if (!key)
        return key.error();

    MCPRelationGraphResponse resp;
    resp.root = key.value();
    resp.maxDepth = req.maxDepth.value_or(ctx.value()->config().defaultMaxDepth);
    resp.graph = ctx.value()->relations().getRelationGraph(resp.root, resp.maxDepth);
    return resp;
}

Result<MCPCleanupResponse>
MCPServer::handleCleanupInvalidRelations(const MCPProjectRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();

    auto relations = ctx.value()->relations().cleanupInvalidRelations();
    if (!relations)
        return relations.error();
    auto comments = ctx.value()->comments().cleanupInvalidComments();
    if (!comments)
        return comments.error();

    MCPCleanupResponse resp;
    resp.removedRelations = relations.value();
    resp.removedComments = comments.value();
    return resp;
}

Result<MCPFileInfoResponse> MCPServer::handleGetFileInfo(const MCPFilePathRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();
    auto key = ctx.value()->resolveFileKey(req.filePath);
    if (!key)
        return key.error();

    MetadataQueryService service(ctx.value());
    auto info = service.getFileInfo(key.value());
    if (!info)
        return info.error();

    MCPFileInfoResponse resp;
    resp.info = toMcpFileInfo(std::move(info).value());
    return resp;
}

Result<MCPSystemStatusResponse> MCPServer::handleGetSystemStatus(const MCPProjectRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();

    MetadataQueryService service(ctx.value());
    auto status = service.getSystemStatus();
    if (!status)
        return status.error();

    const auto& s = status.value();
    MCPSystemStatusResponse resp;
    resp.totalFiles = s.totalFiles;
    resp.taggedFiles = s.taggedFiles;
    resp.commentedFiles = s.commentedFiles;
    resp.totalRelations = s.totalRelations;
    resp.tagTypes = s.tagStats.tagTypes;
    resp.totalTags = s.tagStats.totalTags;
    return resp;
}

Result<MCPSearchFilesResponse> MCPServer::handleSearchFiles(const MCPKeywordRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();

    MetadataQueryService service(ctx.value());
    auto found = service.searchFiles(req.keyword);
    if (!found)
        return found.error();

    MCPSearchFilesResponse resp;
    resp.files.reserve(found.value().size());
    for (const auto& info : found.value()) {
        resp.files.push_back(toMcpFileInfo(info));
    }
    return resp;
}

Result<MCPQuerySuggestionsResponse>
MCPServer::handleGetQuerySuggestions(const MCPQuerySuggestionsRequest& req) {
    auto ctx = openProject(req.projectPath);
    if (!ctx)
        return ctx.error();

    MetadataQueryService service(ctx.value());
    auto suggestions = service.getQuerySuggestions(req.partial);
    if (!suggestions)
        return suggestions.error();

    MCPQuerySuggestionsResponse resp;
    resp.suggestions = std::move(suggestions).value();
    return resp;
}

} // namespace codenexus::mcp
