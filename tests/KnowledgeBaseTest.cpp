#include <gtest/gtest.h>

#include "kb/Errors.hpp"
#include "kb/KnowledgeBase.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using kb::IngestRequest;
using kb::KnowledgeBase;

namespace {

IngestRequest req(kb::DocId id, const std::string& text, std::vector<std::string> concepts,
                  std::optional<std::string> name = std::nullopt) {
    IngestRequest r;
    r.id = id;
    r.text = text;
    r.concepts = std::move(concepts);
    r.suggested_name = std::move(name);
    return r;
}

class KnowledgeBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto cids = kbase.ingest_batch({
            req(0, "python backend services", {"python", "backend"}),
            req(1, "python web services", {"python", "web"}),
            req(2, "rust systems programming", {"rust"}),
        });
        ASSERT_EQ(cids, (std::vector<kb::ClusterId>{0, 1, 2}));
    }

    KnowledgeBase kbase;
};

} // namespace

TEST_F(KnowledgeBaseTest, IngestIndexesAndClusters) {
    EXPECT_EQ(kbase.document_count(), 3u);
    EXPECT_EQ(kbase.cluster_of(1), std::optional<kb::ClusterId>(1));
    EXPECT_EQ(kbase.cluster_snapshot().size(), 3u);

    // joins cluster 0 on full overlap
    EXPECT_EQ(kbase.ingest(req(3, "python backend jobs", {"Backend", "PYTHON"})), 0u);
    EXPECT_EQ(kbase.match_cluster({"rust"}), std::optional<kb::ClusterId>(2));
}

TEST_F(KnowledgeBaseTest, RejectedDocumentIsNotClustered) {
    EXPECT_THROW(kbase.ingest(req(9, "?!", {"python", "backend"})), kb::EmptyDocumentError);
    EXPECT_THROW(kbase.ingest(req(0, "python again", {"go"})), kb::InvalidArgumentError);

    EXPECT_EQ(kbase.document_count(), 3u);
    EXPECT_FALSE(kbase.cluster_of(9).has_value());
    EXPECT_EQ(kbase.cluster_of(0), std::optional<kb::ClusterId>(0));
    EXPECT_EQ(kbase.cluster_snapshot().size(), 3u);
}

TEST_F(KnowledgeBaseTest, SearchCarriesClusterAndSnippet) {
    auto hits = kbase.search("rust programming", 1);

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].doc_id, 2u);
    EXPECT_EQ(hits[0].cluster_id, std::optional<kb::ClusterId>(2));
    EXPECT_EQ(hits[0].snippet, "rust systems programming");
    EXPECT_EQ(hits[0].token_count, 3u);
}

TEST_F(KnowledgeBaseTest, SearchWithinCluster) {
    auto hits = kbase.search("python services", 5, kb::ClusterId{1});
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].doc_id, 1u);

    // zero-score members are still returned
    auto off_topic = kbase.search("rust", 5, kb::ClusterId{0});
    ASSERT_EQ(off_topic.size(), 1u);
    EXPECT_EQ(off_topic[0].doc_id, 0u);
    EXPECT_DOUBLE_EQ(off_topic[0].score, 0.0);

    EXPECT_THROW(kbase.search("python", 5, kb::ClusterId{42}), kb::NotFoundError);
}

TEST_F(KnowledgeBaseTest, RemoveDropsIndexAndMembership) {
    kbase.remove(1);

    EXPECT_EQ(kbase.document_count(), 2u);
    EXPECT_FALSE(kbase.cluster_of(1).has_value());
    EXPECT_THROW(kbase.remove(1), kb::NotFoundError);

    // the emptied cluster stays and filters to nothing
    EXPECT_EQ(kbase.cluster_snapshot().size(), 3u);
    EXPECT_TRUE(kbase.search("", 5, kb::ClusterId{1}).empty());
}

TEST_F(KnowledgeBaseTest, UpdateTextKeepsCluster) {
    kbase.update_text(2, "rust programming language");
    EXPECT_EQ(kbase.cluster_of(2), std::optional<kb::ClusterId>(2));
    EXPECT_EQ(kbase.search("rust", 1)[0].snippet, "rust programming language");
    EXPECT_THROW(kbase.update_text(99, "text"), kb::NotFoundError);
}

TEST_F(KnowledgeBaseTest, RenameAndSimilarTo) {
    kbase.rename_cluster(2, "Systems");
    EXPECT_EQ(kbase.cluster_snapshot()[2].name, "Systems");
    EXPECT_THROW(kbase.rename_cluster(77, "x"), kb::NotFoundError);

    auto hits = kbase.similar_to(0, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].doc_id, 1u);
    EXPECT_EQ(hits[0].cluster_id, std::optional<kb::ClusterId>(1));
}

TEST(KnowledgeBaseBatchTest, BatchClustersInRequestOrder) {
    KnowledgeBase kbase;
    auto cids = kbase.ingest_batch({
        req(10, "python fastapi tutorial", {"python", "fastapi"}, std::string("Web")),
        req(11, "python flask tutorial", {"python", "flask"}, std::string("Web")),
        req(12, "python fastapi tutorial", {"python", "fastapi"}),
        req(13, "sourdough bread baking", {"baking", "bread"}),
    });

    EXPECT_EQ(cids, (std::vector<kb::ClusterId>{0, 0, 0, 1}));
    EXPECT_EQ(kbase.document_count(), 4u);

    auto groups = kbase.find_duplicates();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].primary, 10u);
    ASSERT_EQ(groups[0].duplicates.size(), 1u);
    EXPECT_EQ(groups[0].duplicates[0].doc_id, 12u);

    auto areas = kbase.knowledge_areas();
    ASSERT_EQ(areas.size(), 2u);
    EXPECT_EQ(areas[0].name, "Web");
    EXPECT_EQ(areas[0].total_documents, 3u);
}

TEST(KnowledgeBaseBatchTest, InvalidBatchChangesNothing) {
    KnowledgeBase kbase;
    EXPECT_THROW(kbase.ingest_batch({req(1, "fine text", {"a"}), req(2, "", {"b"})}), kb::EmptyDocumentError);

    EXPECT_EQ(kbase.document_count(), 0u);
    EXPECT_TRUE(kbase.cluster_snapshot().empty());
}

TEST(KnowledgeBaseBatchTest, BatchIsAllOrNothingAcrossIndexAndClusters) {
    KnowledgeBase kbase;
    kbase.ingest(req(1, "python web services", {"python", "web"}));

    // id 1 already indexed: nothing from this batch may land anywhere
    EXPECT_THROW(kbase.ingest_batch({req(2, "rust systems", {"rust"}), req(1, "dup", {"dup"})}),
                 kb::InvalidArgumentError);
    EXPECT_EQ(kbase.document_count(), 1u);
    EXPECT_FALSE(kbase.cluster_of(2).has_value());
    EXPECT_EQ(kbase.cluster_snapshot().size(), 1u);

    // a successful batch indexes and clusters every document
    auto cids = kbase.ingest_batch({req(2, "rust systems", {"rust"}), req(3, "go services", {"go"})});
    ASSERT_EQ(cids.size(), 2u);
    EXPECT_EQ(kbase.document_count(), 3u);
    EXPECT_EQ(kbase.cluster_of(2), std::optional<kb::ClusterId>(cids[0]));
    EXPECT_EQ(kbase.cluster_of(3), std::optional<kb::ClusterId>(cids[1]));
}

TEST(KnowledgeBaseConfigTest, SnippetLengthFromConfig) {
    kb::EngineConfig cfg;
    cfg.snippet_chars = 10;
    KnowledgeBase kbase(cfg);
    kbase.ingest(req(1, "distributed consensus protocols explained", {"raft"}));

    auto hits = kbase.search("consensus", 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].snippet, "distribute...");
}

TEST(KnowledgeBaseConcurrencyTest, ReadersRunAlongsideWriter) {
    KnowledgeBase kbase;
    kbase.ingest(req(0, "python services seed", {"python"}));

    std::atomic<bool> done{false};
    std::atomic<int> failures{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            while (!done.load()) {
                try {
                    auto hits = kbase.search("python services", 3);
                    if (hits.empty()) failures.fetch_add(1);
                    kbase.knowledge_areas();
                } catch (const kb::EngineError&) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    for (kb::DocId id = 1; id <= 200; ++id) {
        kbase.ingest(req(id, "python services document " + std::to_string(id),
                         {"python", "topic" + std::to_string(id % 7)}));
    }
    done.store(true);
    for (auto& th : readers) th.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(kbase.document_count(), 201u);
}
