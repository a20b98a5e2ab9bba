#pragma once

#include <codenexus/app/services/metadata_query_service.hpp>
#include <codenexus/app/services/project_context.hpp>
#include <codenexus/core/types.h>
#include <codenexus/mcp/error_handling.h>
#include <codenexus/mcp/tool_registry.h>

#include <nlohmann/json.hpp>
#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace codenexus::mcp {

using json = nlohmann::json;

enum class TransportState : int { Disconnected = 0, Connected = 1, Error = 2, Closing = 3 };

/**
 * Transport interface for MCP communication
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual void send(const json& message) = 0;
    virtual MessageResult receive() = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
    virtual TransportState getState() const = 0;
};

/**
 * Standard I/O transport. Reads and writes NDJSON: one JSON message per line, no
 * embedded newlines. Streams default to std::cin / std::cout.
 */
class StdioTransport : public ITransport {
public:
    StdioTransport();
    StdioTransport(std::istream& in, std::ostream& out);

    void send(const json& message) override;
    MessageResult receive() override;
    bool isConnected() const override { return state_.load() == TransportState::Connected; }
    void close() override { state_.store(TransportState::Closing); }
    TransportState getState() const override { return state_.load(); }

    // Set external shutdown flag checked between reads
    void setShutdownFlag(std::atomic<bool>* shutdown) { externalShutdown_ = shutdown; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::atomic<TransportState> state_{TransportState::Connected};
    std::atomic<bool>* externalShutdown_{nullptr};
    std::atomic<size_t> errorCount_{0};
    mutable std::mutex outMutex_;

    bool shouldRetryAfterError() const noexcept;
    void recordError() noexcept;
    void resetErrorCount() noexcept;
};

/**
 * MCP server exposing the metadata tools over JSON-RPC 2.0.
 *
 * Requests are handled one at a time on the calling thread. Every tool takes a
 * project_path; projects are opened on first use through the ProjectRegistry.
 */
class MCPServer {
public:
    MCPServer(std::unique_ptr<ITransport> transport,
              std::shared_ptr<app::services::ProjectRegistry> projects,
              std::atomic<bool>* externalShutdown = nullptr);
    ~MCPServer();

    // Serve until EOF, "exit", stop() or the external shutdown flag
    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Route one message; notifications yield no response
    std::optional<json> handleRequest(const json& request);

    json listTools() const { return toolRegistry_.listTools(); }
    json callTool(const std::string& name, const json& arguments);

private:
    struct ServerInfo {
        std::string name = "codenexus";
        std::string version;
    };

    json initialize(const json& params);
    Result<json> dispatchCoreMethod(const std::string& method, const json& params);
    void registerTools();

    // Tool handlers
    Result<MCPFileTagsResponse> handleAddFileTags(const MCPFileTagsRequest& req);
    Result<MCPFileTagsResponse> handleRemoveFileTags(const MCPFileTagsRequest& req);
    Result<MCPQueryFilesResponse> handleQueryFilesByTags(const MCPQueryFilesByTagsRequest& req);
    Result<MCPGetAllTagsResponse> handleGetAllTags(const MCPProjectRequest& req);
    Result<MCPMessageResponse> handleAddFileComment(const MCPFileCommentRequest& req);
    Result<MCPMessageResponse> handleUpdateFileComment(const MCPFileCommentRequest& req);
    Result<MCPMessageResponse> handleAddFileRelation(const MCPFileRelationRequest& req);
    Result<MCPMessageResponse> handleRemoveFileRelation(const MCPFileRelationRequest& req);
    Result<MCPFileRelationsResponse> handleQueryFileRelations(const MCPFilePathRequest& req);
    Result<MCPFileRelationsResponse> handleQueryIncomingRelations(const MCPFilePathRequest& req);
    Result<MCPRelationGraphResponse> handleGetRelationGraph(const MCPRelationGraphRequest& req);
    Result<MCPCleanupResponse> handleCleanupInvalidRelations(const MCPProjectRequest& req);
    Result<MCPFileInfoResponse> handleGetFileInfo(const MCPFilePathRequest& req);
    Result<MCPSystemStatusResponse> handleGetSystemStatus(const MCPProjectRequest& req);
    Result<MCPSearchFilesResponse> handleSearchFiles(const MCPKeywordRequest& req);
    Result<MCPQuerySuggestionsResponse>
    handleGetQuerySuggestions(const MCPQuerySuggestionsRequest& req);

    Result<std::shared_ptr<app::services::ProjectContext>> openProject(const std::string& path);

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<app::services::ProjectRegistry> projects_;
    std::atomic<bool>* externalShutdown_;
    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
    ToolRegistry toolRegistry_;
    ServerInfo serverInfo_;
    std::string negotiatedProtocolVersion_;
};

} // namespace codenexus::mcp
