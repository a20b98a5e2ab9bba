#include <gtest/gtest.h>

#include <codenexus/metadata/relation_graph.h>

#include "common/test_helpers.h"

#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace codenexus;
using namespace codenexus::metadata;
using codenexus::tests::FakeFileSystem;
using codenexus::tests::InMemorySnapshotStore;

class RelationGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemorySnapshotStore>();
        fs_ = std::make_shared<FakeFileSystem>(
            std::initializer_list<std::string>{"A", "B", "C", "D"});
        graph_ = std::make_unique<RelationGraph>(store_, fs_);
        ASSERT_TRUE(graph_->initialize());
    }

    std::shared_ptr<InMemorySnapshotStore> store_;
    std::shared_ptr<FakeFileSystem> fs_;
    std::unique_ptr<RelationGraph> graph_;
};

TEST_F(RelationGraphTest, AddMaintainsBothDirections) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "calls"));

    auto out = graph_->getOutgoing("A");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], (Relation{"B", "calls"}));

    auto in = graph_->getIncoming("B");
    ASSERT_EQ(in.size(), 1u);
    EXPECT_EQ(in[0], (IncomingRelation{"A", "calls"}));

    EXPECT_TRUE(graph_->hasRelation("A", "B"));
    EXPECT_FALSE(graph_->hasRelation("B", "A"));
    ASSERT_EQ(store_->relations.fileRelations.count("A"), 1u);
}

TEST_F(RelationGraphTest, DuplicateFailsUntilRemoved) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "calls"));

    auto dup = graph_->addRelation("A", "B", "also calls");
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::RelationAlreadyExists);
    EXPECT_EQ(graph_->getOutgoing("A").size(), 1u);

    ASSERT_TRUE(graph_->removeRelation("A", "B"));
    EXPECT_TRUE(graph_->getOutgoing("A").empty());
    EXPECT_TRUE(graph_->getIncoming("B").empty());
    EXPECT_EQ(store_->relations.fileRelations.count("A"), 0u);

    EXPECT_TRUE(graph_->addRelation("A", "B", "also calls"));
    EXPECT_EQ(graph_->getOutgoing("A")[0].description, "also calls");
}

TEST_F(RelationGraphTest, AddValidatesInputs) {
    EXPECT_EQ(graph_->addRelation("X", "B", "d").error().code, ErrorCode::FileNotFound);
    EXPECT_EQ(graph_->addRelation("A", "X", "d").error().code, ErrorCode::FileNotFound);
    EXPECT_EQ(graph_->addRelation("A", "B", "  ").error().code, ErrorCode::ConfigError);
    EXPECT_EQ(graph_->getStats().totalRelations, 0u);
}

TEST_F(RelationGraphTest, RemoveUnknownRelation) {
    EXPECT_EQ(graph_->removeRelation("A", "B").error().code, ErrorCode::RelationNotFound);
    ASSERT_TRUE(graph_->addRelation("A", "C", "uses"));
    EXPECT_EQ(graph_->removeRelation("A", "B").error().code, ErrorCode::RelationNotFound);
}

TEST_F(RelationGraphTest, RemoveWorksForDeletedFiles) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "calls"));
    fs_->remove("A");
    fs_->remove("B");
    EXPECT_TRUE(graph_->removeRelation("A", "B"));
}

TEST_F(RelationGraphTest, CycleTraversalVisitsEachNodeOnce) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "ab"));
    ASSERT_TRUE(graph_->addRelation("B", "C", "bc"));
    ASSERT_TRUE(graph_->addRelation("C", "A", "ca"));

    auto graph = graph_->getRelationGraph("A", 3);
    ASSERT_EQ(graph.size(), 2u);
    EXPECT_EQ(graph.at("A"), (std::vector<Relation>{{"B", "ab"}}));
    EXPECT_EQ(graph.at("B"), (std::vector<Relation>{{"C", "bc"}}));
}

TEST_F(RelationGraphTest, TraversalRespectsDepth) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "ab"));
    ASSERT_TRUE(graph_->addRelation("B", "C", "bc"));
    ASSERT_TRUE(graph_->addRelation("C", "D", "cd"));

    EXPECT_TRUE(graph_->getRelationGraph("A", 0).empty());

    auto one = graph_->getRelationGraph("A", 1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one.count("A"), 1u);

    auto two = graph_->getRelationGraph("A", 2);
    EXPECT_EQ(two.size(), 2u);
    EXPECT_EQ(two.count("C"), 0u);

    EXPECT_EQ(graph_->getRelationGraph("A", 10).size(), 3u);
}

TEST_F(RelationGraphTest, SelfLoopIsAllowedButNotTraversed) {
    ASSERT_TRUE(graph_->addRelation("A", "A", "recursive"));
    EXPECT_TRUE(graph_->hasRelation("A", "A"));
    EXPECT_TRUE(graph_->getRelationGraph("A", 3).empty());
}

TEST_F(RelationGraphTest, QueryByDescriptionIsCaseInsensitive) {
    ASSERT_TRUE(graph_->addRelation("B", "C", "Calls helper"));
    ASSERT_TRUE(graph_->addRelation("A", "B", "imports"));
    ASSERT_TRUE(graph_->addRelation("A", "D", "CALLS api"));

    auto matches = graph_->queryByDescription("calls");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].source, "A");
    EXPECT_EQ(matches[0].relation.target, "D");
    EXPECT_EQ(matches[1].source, "B");
}

TEST_F(RelationGraphTest, CleanupCountsEachEdgeOnce) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "ab"));
    ASSERT_TRUE(graph_->addRelation("A", "C", "ac"));
    ASSERT_TRUE(graph_->addRelation("C", "D", "cd"));
    ASSERT_TRUE(graph_->addRelation("D", "A", "da"));

    // C disappears: its own edge and the edge pointing at it go
    fs_->remove("C");
    auto removed = graph_->cleanupInvalidRelations();
    ASSERT_TRUE(removed) << removed.error().message;
    EXPECT_EQ(removed.value(), 2u);

    EXPECT_EQ(graph_->getOutgoing("A"), (std::vector<Relation>{{"B", "ab"}}));
    EXPECT_TRUE(graph_->getOutgoing("C").empty());
    EXPECT_TRUE(graph_->getIncoming("D").empty());
    EXPECT_EQ(graph_->getIncoming("A").size(), 1u);
    EXPECT_EQ(store_->relations.fileRelations.count("C"), 0u);
}

TEST_F(RelationGraphTest, CleanupWithNothingStaleDoesNotSave) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "ab"));
    const int saves = store_->saveCount;
    auto removed = graph_->cleanupInvalidRelations();
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 0u);
    EXPECT_EQ(store_->saveCount, saves);
}

TEST_F(RelationGraphTest, FailedSaveRollsBack) {
    ASSERT_TRUE(graph_->addRelation("A", "B", "ab"));
    ASSERT_TRUE(graph_->addRelation("A", "C", "ac"));

    store_->failNextSave = true;
    ASSERT_FALSE(graph_->addRelation("A", "D", "ad"));
    EXPECT_FALSE(graph_->hasRelation("A", "D"));
    EXPECT_TRUE(graph_->getIncoming("D").empty());

    store_->failNextSave = true;
    ASSERT_FALSE(graph_->removeRelation("A", "B"));
    EXPECT_EQ(graph_->getOutgoing("A"),
              (std::vector<Relation>{{"B", "ab"}, {"C", "ac"}}));
    EXPECT_EQ(graph_->getIncoming("B").size(), 1u);

    fs_->remove("C");
    store_->failNextSave = true;
    ASSERT_FALSE(graph_->cleanupInvalidRelations());
    EXPECT_TRUE(graph_->hasRelation("A", "C"));
}

TEST_F(RelationGraphTest, FailedRemovalRestoresIncomingOrder) {
    ASSERT_TRUE(graph_->addRelation("A", "C", "ac"));
    ASSERT_TRUE(graph_->addRelation("B", "C", "bc"));
    ASSERT_TRUE(graph_->addRelation("D", "C", "dc"));
    const auto before = graph_->getIncoming("C");

    store_->failNextSave = true;
    ASSERT_FALSE(graph_->removeRelation("A", "C"));
    EXPECT_EQ(graph_->getIncoming("C"), before);
    EXPECT_EQ(graph_->getIncoming("C").front().source, "A");
}

TEST_F(RelationGraphTest, LongChainTraversalWithUnboundedDepth) {
    constexpr int kLength = 100000;
    for (int i = 0; i + 1 < kLength; ++i) {
        store_->relations.fileRelations["n" + std::to_string(i)] = {
            Relation{"n" + std::to_string(i + 1), "next"}};
    }
    RelationGraph chain(store_, fs_);
    ASSERT_TRUE(chain.initialize());

    auto graph = chain.getRelationGraph("n0", std::numeric_limits<std::size_t>::max());
    EXPECT_EQ(graph.size(), static_cast<std::size_t>(kLength - 1));
    EXPECT_EQ(graph.at("n0"), (std::vector<Relation>{{"n1", "next"}}));
    EXPECT_EQ(graph.count("n" + std::to_string(kLength - 1)), 0u);
}

TEST_F(RelationGraphTest, StatsAndRelatedFiles) {
    ASSERT_TRUE(graph_->addRelation("B", "C", "bc"));
    ASSERT_TRUE(graph_->addRelation("A", "C", "ac"));
    ASSERT_TRUE(graph_->addRelation("A", "B", "ab"));

    auto stats = graph_->getStats();
    EXPECT_EQ(stats.filesWithRelations, 2u);
    EXPECT_EQ(stats.totalRelations, 3u);
    EXPECT_EQ(stats.filesWithIncoming, 2u);
    EXPECT_EQ(graph_->getRelatedFiles(), (std::vector<std::string>{"A", "B"}));
}

TEST_F(RelationGraphTest, InitializeBuildsReverseIndex) {
    store_->relations.fileRelations["A"] = {Relation{"B", "ab"}, Relation{"C", "ac"}};
    store_->relations.fileRelations["D"] = {Relation{"B", "db"}};

    RelationGraph reloaded(store_, fs_);
    ASSERT_TRUE(reloaded.initialize());
    EXPECT_EQ(reloaded.getIncoming("B").size(), 2u);
    EXPECT_EQ(reloaded.getIncoming("C"), (std::vector<IncomingRelation>{{"A", "ac"}}));
}
