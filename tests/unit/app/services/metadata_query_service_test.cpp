#include <gtest/gtest.h>

#include <codenexus/app/services/metadata_query_service.hpp>

#include "common/test_helpers.h"

#include <memory>

using namespace codenexus;
using namespace codenexus::app::services;
using codenexus::tests::FakeFileSystem;
using codenexus::tests::InMemorySnapshotStore;

using Files = std::vector<std::string>;

class MetadataQueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemorySnapshotStore>();
        fs_ = std::make_shared<FakeFileSystem>(std::initializer_list<std::string>{
            "src/api.rs", "src/db.rs", "src/util.rs", "web/app.ts", "README.md"});
        config::NexusConfig cfg;
        cfg.suggestionLimit = 3;
        context_ = std::make_shared<ProjectContext>("/project", cfg, store_, fs_);
        ASSERT_TRUE(context_->initialize());
        service_ = std::make_unique<MetadataQueryService>(context_);

        auto& tags = context_->tags();
        ASSERT_TRUE(tags.addTags("src/api.rs", {"lang:rust", "category:api"}));
        ASSERT_TRUE(tags.addTags("src/db.rs", {"lang:rust", "category:storage"}));
        ASSERT_TRUE(tags.addTags("web/app.ts", {"lang:typescript", "category:api"}));

        auto& relations = context_->relations();
        ASSERT_TRUE(relations.addRelation("src/api.rs", "src/db.rs", "Calls storage layer"));
        ASSERT_TRUE(relations.addRelation("web/app.ts", "src/api.rs", "Calls REST api"));
        ASSERT_TRUE(relations.addRelation("src/util.rs", "src/api.rs", "helper for"));

        ASSERT_TRUE(context_->comments().addComment("README.md", "Describes the storage design"));
        ASSERT_TRUE(context_->comments().addComment("src/api.rs", "HTTP handlers"));
    }

    std::shared_ptr<InMemorySnapshotStore> store_;
    std::shared_ptr<FakeFileSystem> fs_;
    std::shared_ptr<ProjectContext> context_;
    std::unique_ptr<MetadataQueryService> service_;
};

TEST_F(MetadataQueryServiceTest, TagQueryReportsTotal) {
    auto result = service_->executeTagQuery("category:api AND NOT lang:typescript");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().files, (Files{"src/api.rs"}));
    EXPECT_EQ(result.value().total, 1u);
}

TEST_F(MetadataQueryServiceTest, FileInfoCombinesManagers) {
    auto info = service_->getFileInfo("src/api.rs");
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().path, "src/api.rs");
    EXPECT_EQ(info.value().tags, (Files{"category:api", "lang:rust"}));
    EXPECT_EQ(info.value().comment, std::optional<std::string>("HTTP handlers"));
    ASSERT_EQ(info.value().relations.size(), 1u);
    EXPECT_EQ(info.value().relations[0].target, "src/db.rs");
    EXPECT_EQ(info.value().incomingRelations.size(), 2u);
}

TEST_F(MetadataQueryServiceTest, FileInfoOfUnknownFileIsEmpty) {
    auto info = service_->getFileInfo("nowhere.rs");
    ASSERT_TRUE(info);
    EXPECT_TRUE(info.value().tags.empty());
    EXPECT_FALSE(info.value().comment.has_value());
    EXPECT_TRUE(info.value().relations.empty());
}

TEST_F(MetadataQueryServiceTest, ComplexQueryIntersects) {
    auto tagsOnly = service_->executeComplexQuery(std::string("category:api"), std::nullopt);
    ASSERT_TRUE(tagsOnly);
    EXPECT_EQ(tagsOnly.value().files, (Files{"src/api.rs", "web/app.ts"}));

    auto relOnly = service_->executeComplexQuery(std::nullopt, std::string("calls"));
    ASSERT_TRUE(relOnly);
    EXPECT_EQ(relOnly.value().files, (Files{"src/api.rs", "web/app.ts"}));

    auto both = service_->executeComplexQuery(std::string("lang:rust"), std::string("calls"));
    ASSERT_TRUE(both);
    EXPECT_EQ(both.value().files, (Files{"src/api.rs"}));
    EXPECT_EQ(both.value().total, 1u);

    auto neither = service_->executeComplexQuery(std::nullopt, std::nullopt);
    ASSERT_TRUE(neither);
    EXPECT_TRUE(neither.value().files.empty());
}

TEST_F(MetadataQueryServiceTest, ComplexQueryPropagatesSyntaxErrors) {
    auto r = service_->executeComplexQuery(std::string("lang:rust AND"), std::string("calls"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidQuerySyntax);
}

TEST_F(MetadataQueryServiceTest, SystemStatusCounts) {
    auto status = service_->getSystemStatus();
    ASSERT_TRUE(status);
    EXPECT_EQ(status.value().taggedFiles, 3u);
    EXPECT_EQ(status.value().commentedFiles, 2u);
    EXPECT_EQ(status.value().totalRelations, 3u);
    EXPECT_EQ(status.value().totalFiles, 3u);
    EXPECT_EQ(status.value().tagStats.totalTags, 4u);
    EXPECT_EQ(status.value().tagStats.tagTypes.at("lang"), (Files{"rust", "typescript"}));
}

TEST_F(MetadataQueryServiceTest, SearchUnitesCommentsAndRelations) {
    auto found = service_->searchFiles("storage");
    ASSERT_TRUE(found);
    ASSERT_EQ(found.value().size(), 2u);
    EXPECT_EQ(found.value()[0].path, "README.md");
    EXPECT_EQ(found.value()[1].path, "src/api.rs");
}

TEST_F(MetadataQueryServiceTest, RelatedFilesByTagAndEdge) {
    auto related = service_->getRelatedFiles("src/api.rs", 10);
    ASSERT_TRUE(related);
    EXPECT_EQ(related.value(), (Files{"src/db.rs", "src/util.rs", "web/app.ts"}));

    auto capped = service_->getRelatedFiles("src/api.rs", 1);
    ASSERT_TRUE(capped);
    EXPECT_EQ(capped.value(), (Files{"src/db.rs"}));
}

TEST_F(MetadataQueryServiceTest, BatchFileInfoKeepsOrder) {
    auto infos = service_->getBatchFileInfo({"web/app.ts", "README.md"});
    ASSERT_TRUE(infos);
    ASSERT_EQ(infos.value().size(), 2u);
    EXPECT_EQ(infos.value()[0].path, "web/app.ts");
    EXPECT_EQ(infos.value()[1].comment, std::optional<std::string>("Describes the storage design"));
}

TEST_F(MetadataQueryServiceTest, ValidateQuerySyntax) {
    EXPECT_TRUE(service_->validateQuerySyntax("lang:rust OR lang:go"));
    EXPECT_EQ(service_->validateQuerySyntax("lang:rust:x").error().code,
              ErrorCode::InvalidQuerySyntax);
    EXPECT_EQ(service_->validateQuerySyntax("(lang:rust").error().code,
              ErrorCode::InvalidQuerySyntax);
}

TEST_F(MetadataQueryServiceTest, SuggestionsMatchTypePrefixOrText) {
    auto byType = service_->getQuerySuggestions("lang");
    ASSERT_TRUE(byType);
    EXPECT_EQ(byType.value(), (Files{"lang:rust", "lang:typescript"}));

    auto byText = service_->getQuerySuggestions("stor");
    ASSERT_TRUE(byText);
    EXPECT_EQ(byText.value(), (Files{"category:storage"}));

    auto capped = service_->getQuerySuggestions(":");
    ASSERT_TRUE(capped);
    EXPECT_EQ(capped.value().size(), 3u);

    auto none = service_->getQuerySuggestions("");
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}
