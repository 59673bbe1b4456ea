#include <gtest/gtest.h>

#include <cmath>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "rag_core/services/graph_service.hpp"

namespace rag_core {

using rag_tests::TestUtilities;

TEST(GraphScoringTest, JaccardOfTagSets) {
  EXPECT_FLOAT_EQ(GraphService::jaccard({"a", "b"}, {"b", "c"}), 1.0f / 3.0f);
  EXPECT_FLOAT_EQ(GraphService::jaccard({"a", "a"}, {"a"}), 1.0f);
  EXPECT_FLOAT_EQ(GraphService::jaccard({}, {"a"}), 0.0f);
}

TEST(GraphScoringTest, SharedTagsCanLiftPairOverThreshold) {
  auto link = GraphService::score_pair("a", "b", 0.45f, {"x"}, {"x"}, 0.5f);

  ASSERT_TRUE(link.has_value());
  EXPECT_NEAR(link->similarity, 0.5625f, 1e-6);
  EXPECT_TRUE(link->has_tags);
  EXPECT_FALSE(link->has_semantic);
}

TEST(GraphScoringTest, PairBelowThresholdWithoutTagsIsDropped) {
  EXPECT_FALSE(GraphService::score_pair("a", "b", 0.45f, {}, {}, 0.5f).has_value());
  EXPECT_FALSE(GraphService::score_pair("a", "b", 0.3f, {"x"}, {"x"}, 0.5f).has_value());
}

TEST(GraphScoringTest, BoostedSimilarityIsClampedToOne) {
  auto link = GraphService::score_pair("a", "b", 0.95f, {"x"}, {"x"}, 0.0f);
  ASSERT_TRUE(link.has_value());
  EXPECT_FLOAT_EQ(link->similarity, 1.0f);
  EXPECT_TRUE(link->has_semantic);
  EXPECT_TRUE(link->has_tags);
}

TEST(GraphScoringTest, VectorHelpers) {
  EXPECT_EQ(mean_vector({{1.0f, 3.0f}, {3.0f, 5.0f}}), (std::vector<float>{2.0f, 4.0f}));
  EXPECT_TRUE(mean_vector({}).empty());
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f, 0.0f}, {2.0f, 0.0f}), 1.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f, 0.0f}, {0.0f, 0.0f}), 0.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1.0f}, {1.0f, 0.0f}), 0.0f);
}

class GraphServiceTest : public rag_tests::VectorStoreTestBase {
 protected:
  void SetUp() override {
    VectorStoreTestBase::SetUp();
    repository_ = std::make_shared<rag_tests::InMemoryDocumentRepository>();
    graph_ = std::make_unique<GraphService>(store_, repository_);
  }

  std::vector<float> at(float x, float y) {
    std::vector<float> v(kDimension, 0.0f);
    v[0] = x;
    v[1] = y;
    return v;
  }

  std::shared_ptr<rag_tests::InMemoryDocumentRepository> repository_;
  std::unique_ptr<GraphService> graph_;
};

TEST_F(GraphServiceTest, BuildsDocumentAndExternalNodes) {
  repository_->put("doc1", "[]", "One", {"ml"});
  repository_->put("doc2", "[]", "Two", {"ml"});
  store_->upsert(TestUtilities::create_block_vector("p1", "doc1", at(1.0f, 0.0f)));
  store_->upsert(TestUtilities::create_block_vector("p2", "doc1", at(1.0f, 0.0f)));
  const float sim = 0.45f;
  store_->upsert(TestUtilities::create_block_vector("q1", "doc2", at(sim, std::sqrt(1.0f - sim * sim))));
  auto bm = TestUtilities::create_block_vector("doc1_bm_bookmark_chunk_0", "doc1", at(0.0f, 1.0f), "bookmark");
  bm.source_block_id = "bm";
  store_->upsert(bm);
  store_->save_external_content({.id = "doc1_bm", .doc_id = "doc1", .block_id = "bm",
                                 .block_type = "bookmark", .title = "Saved page", .raw_content = "x"});

  GraphData graph = graph_->build_graph(0.5f);

  ASSERT_EQ(graph.nodes.size(), 3u);
  const GraphNode* doc1 = nullptr;
  const GraphNode* bookmark = nullptr;
  for (const auto& node : graph.nodes) {
    if (node.id == "doc1")
      doc1 = &node;
    if (node.id == "doc1_bm_bookmark")
      bookmark = &node;
  }
  ASSERT_NE(doc1, nullptr);
  ASSERT_NE(bookmark, nullptr);
  EXPECT_EQ(doc1->type, "document");
  EXPECT_EQ(doc1->title, "One");
  EXPECT_EQ(doc1->val, 2);
  EXPECT_EQ(bookmark->type, "bookmark");
  EXPECT_EQ(bookmark->title, "Saved page");
  EXPECT_EQ(bookmark->parent_doc_id, "doc1");
  EXPECT_EQ(bookmark->parent_block_id, "bm");

  // doc1-doc2 is linked only through the shared tag; doc2-bookmark is semantic (sin(acos(0.45)) > 0.5)
  ASSERT_EQ(graph.links.size(), 2u);
  for (const auto& link : graph.links) {
    if (link.source == "doc1" && link.target == "doc2") {
      EXPECT_TRUE(link.has_tags);
      EXPECT_FALSE(link.has_semantic);
    } else {
      EXPECT_TRUE(link.has_semantic);
      EXPECT_FALSE(link.has_tags);
    }
  }
}

TEST_F(GraphServiceTest, EmptyStoreGivesEmptyGraph) {
  GraphData graph = graph_->build_graph();
  EXPECT_TRUE(graph.nodes.empty());
  EXPECT_TRUE(graph.links.empty());
}

}  // namespace rag_core
