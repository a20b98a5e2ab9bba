#include <gtest/gtest.h>

#include <codenexus/mcp/tool_registry.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using codenexus::Error;
using codenexus::ErrorCode;
using codenexus::Result;
using codenexus::mcp::json;
using codenexus::mcp::ToolRegistry;

struct DummyRequest {
    using RequestType = DummyRequest;

    int value = 0;

    static DummyRequest fromJson(const json& j) {
        DummyRequest req;
        req.value = j.at("value").get<int>();
        return req;
    }

    json toJson() const { return json{{"value", value}}; }
};

struct DummyResponse {
    using ResponseType = DummyResponse;

    int value = 0;

    static DummyResponse fromJson(const json& j) {
        DummyResponse resp;
        resp.value = j.value("value", 0);
        return resp;
    }

    json toJson() const { return json{{"value", value}}; }
};

json payloadOf(const json& result) {
    return json::parse(result.at("content").at(0).at("text").get<std::string>());
}

} // namespace

TEST(MCPToolRegistryTest, WrapsSuccessfulResultPayload) {
    ToolRegistry registry;
    registry.registerTool<DummyRequest, DummyResponse>(
        "dummy", [](const DummyRequest& req) -> Result<DummyResponse> {
            return DummyResponse{req.value + 1};
        },
        json{}, std::string{"adds one"});

    auto discovery = registry.listTools();
    ASSERT_EQ(discovery.at("tools").size(), 1u);
    EXPECT_EQ(discovery["tools"][0]["name"], "dummy");
    EXPECT_EQ(discovery["tools"][0]["description"], "adds one");
    EXPECT_EQ(discovery["tools"][0]["inputSchema"], json({{"type", "object"}}));

    const auto response = registry.callTool("dummy", json{{"value", 1}});
    ASSERT_TRUE(response.at("content").is_array());
    EXPECT_EQ(response["content"][0]["type"], "text");
    EXPECT_FALSE(response.contains("isError"));
    EXPECT_EQ(payloadOf(response)["value"], 2);
}

TEST(MCPToolRegistryTest, HandlerErrorBecomesToolError) {
    ToolRegistry registry;
    registry.registerTool<DummyRequest, DummyResponse>(
        "fails", [](const DummyRequest&) -> Result<DummyResponse> {
            return Error{ErrorCode::TagNotFound, "Tag 'a:b' not found on file f1"};
        });

    const auto response = registry.callTool("fails", json{{"value", 0}});
    EXPECT_EQ(response.value("isError", false), true);
    auto payload = payloadOf(response);
    EXPECT_EQ(payload["error"]["code"], "TAG_NOT_FOUND");
    EXPECT_EQ(payload["error"]["message"], "Tag 'a:b' not found on file f1");
    EXPECT_FALSE(payload["error"]["suggestion"].get<std::string>().empty());
}

TEST(MCPToolRegistryTest, MissingArgumentIsConfigError) {
    ToolRegistry registry;
    registry.registerTool<DummyRequest, DummyResponse>(
        "dummy", [](const DummyRequest& req) -> Result<DummyResponse> {
            return DummyResponse{req.value};
        });

    const auto response = registry.callTool("dummy", json::object());
    EXPECT_EQ(response.value("isError", false), true);
    auto payload = payloadOf(response);
    EXPECT_EQ(payload["error"]["code"], "CONFIG_ERROR");
    EXPECT_EQ(payload["error"]["message"].get<std::string>().rfind("Invalid arguments", 0), 0u);
}

TEST(MCPToolRegistryTest, UnknownToolIsToolError) {
    ToolRegistry registry;
    const auto response = registry.callTool("nope", json::object());
    EXPECT_EQ(response.value("isError", false), true);
    EXPECT_FALSE(registry.hasTool("nope"));
}

TEST(MCPToolRegistryTest, DuplicateRegistrationKeepsFirst) {
    ToolRegistry registry;
    auto handler = [](const DummyRequest& req) -> Result<DummyResponse> {
        return DummyResponse{req.value};
    };
    registry.registerTool<DummyRequest, DummyResponse>("dummy", handler, json{}, "first");
    registry.registerTool<DummyRequest, DummyResponse>("dummy", handler, json{}, "second");
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.listTools()["tools"][0]["description"], "first");
}

TEST(MCPToolDtoTest, FileTagsRequestRequiresPaths) {
    using codenexus::mcp::MCPFileTagsRequest;
    auto req = MCPFileTagsRequest::fromJson(
        json{{"project_path", "/p"}, {"file_path", "a.rs"}, {"tags", {"a:x", "b:y"}}});
    EXPECT_EQ(req.projectPath, "/p");
    EXPECT_EQ(req.filePath, "a.rs");
    EXPECT_EQ(req.tags, (std::vector<std::string>{"a:x", "b:y"}));

    EXPECT_THROW(MCPFileTagsRequest::fromJson(json{{"file_path", "a.rs"}}), json::exception);
}

TEST(MCPToolDtoTest, RelationGraphRequestOptionalDepth) {
    using codenexus::mcp::MCPRelationGraphRequest;
    auto withDepth = MCPRelationGraphRequest::fromJson(
        json{{"project_path", "/p"}, {"file_path", "a.rs"}, {"max_depth", 5}});
    ASSERT_TRUE(withDepth.maxDepth.has_value());
    EXPECT_EQ(*withDepth.maxDepth, 5u);

    auto without =
        MCPRelationGraphRequest::fromJson(json{{"project_path", "/p"}, {"file_path", "a.rs"}});
    EXPECT_FALSE(without.maxDepth.has_value());
}

TEST(MCPToolDtoTest, FileTagsRequestRejectsMalformedTags) {
    using codenexus::mcp::MCPFileTagsRequest;
    const json base{{"project_path", "/p"}, {"file_path", "a.rs"}};

    auto mixed = base;
    mixed["tags"] = json::array({"a:x", 5});
    EXPECT_THROW(MCPFileTagsRequest::fromJson(mixed), json::exception);

    auto scalar = base;
    scalar["tags"] = "a:x";
    EXPECT_THROW(MCPFileTagsRequest::fromJson(scalar), json::exception);

    EXPECT_THROW(MCPFileTagsRequest::fromJson(base), json::exception);
}

TEST(MCPToolDtoTest, QueryRequestRequiresQuery) {
    using codenexus::mcp::MCPQueryFilesByTagsRequest;
    EXPECT_THROW(MCPQueryFilesByTagsRequest::fromJson(json{{"project_path", "/p"}}),
                 json::exception);
    EXPECT_THROW(MCPQueryFilesByTagsRequest::fromJson(json{{"project_path", "/p"}, {"query", 3}}),
                 json::exception);
}

TEST(MCPToolDtoTest, RelationGraphRequestRejectsInvalidDepth) {
    using codenexus::mcp::MCPRelationGraphRequest;
    const json base{{"project_path", "/p"}, {"file_path", "a.rs"}};

    auto negative = base;
    negative["max_depth"] = -1;
    EXPECT_THROW(MCPRelationGraphRequest::fromJson(negative), std::invalid_argument);

    auto fractional = base;
    fractional["max_depth"] = 1.5;
    EXPECT_THROW(MCPRelationGraphRequest::fromJson(fractional), std::invalid_argument);

    auto text = base;
    text["max_depth"] = "2";
    EXPECT_THROW(MCPRelationGraphRequest::fromJson(text), std::invalid_argument);

    auto zero = base;
    zero["max_depth"] = 0;
    EXPECT_EQ(MCPRelationGraphRequest::fromJson(zero).maxDepth, std::optional<size_t>{0});

    auto null = base;
    null["max_depth"] = nullptr;
    EXPECT_FALSE(MCPRelationGraphRequest::fromJson(null).maxDepth.has_value());
}

TEST(MCPToolDtoTest, SuggestionRequestAcceptsBothKeys) {
    using codenexus::mcp::MCPQuerySuggestionsRequest;
    EXPECT_EQ(MCPQuerySuggestionsRequest::fromJson(
                  json{{"project_path", "/p"}, {"partial_query", "lang"}})
                  .partial,
              "lang");
    EXPECT_EQ(
        MCPQuerySuggestionsRequest::fromJson(json{{"project_path", "/p"}, {"partial", "cat"}})
            .partial,
        "cat");
}

TEST(MCPToolDtoTest, FileInfoSerializesMissingCommentAsNull) {
    codenexus::mcp::MCPFileInfo info;
    info.path = "a.rs";
    info.tags = {"lang:rust"};
    info.relations = {codenexus::Relation{"b.rs", "calls"}};
    info.incomingRelations = {codenexus::IncomingRelation{"c.rs", "uses"}};

    auto j = info.toJson();
    EXPECT_TRUE(j["comment"].is_null());
    EXPECT_EQ(j["relations"][0]["target"], "b.rs");
    EXPECT_EQ(j["incoming_relations"][0]["source"], "c.rs");
}
