#include <gtest/gtest.h>

#include "cluster/ClusteringEngine.hpp"
#include "kb/Errors.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

using cluster::ClusteringConfig;
using cluster::ClusteringEngine;

TEST(ClusteringEngineTest, NoClustersNoMatch) {
    ClusteringEngine engine;
    EXPECT_FALSE(engine.match_cluster({"python", "fastapi"}).has_value());
}

TEST(ClusteringEngineTest, NameBoostLiftsPartialOverlap) {
    ClusteringEngine engine;
    const kb::ClusterId web = engine.create_cluster({"python", "fastapi"}, "Web");

    // 1/3 alone is below 0.5
    EXPECT_FALSE(engine.match_cluster({"python", "flask"}).has_value());
    EXPECT_FALSE(engine.match_cluster({"python", "flask"}, std::string("Backend")).has_value());

    auto hit = engine.match_cluster({"python", "flask"}, std::string("web"));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, web);

    const cluster::Cluster* c = engine.find_cluster(web);
    ASSERT_NE(c, nullptr);
    std::set<std::string> doc = {"python", "flask"};
    const std::string name = "web";
    EXPECT_NEAR(engine.score(doc, &name, *c), 1.0 / 3.0 + 0.2, 1e-12);
}

TEST(ClusteringEngineTest, CreateFoldsDedupesAndTruncates) {
    ClusteringEngine engine;
    const kb::ClusterId id = engine.create_cluster(
        {"Python", "python", "Flask", "SQL", "Docker", "Redis", "Celery", "Nginx"}, "Backend",
        std::string("intermediate"));

    const cluster::Cluster* c = engine.find_cluster(id);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->concepts, (std::vector<std::string>{"python", "flask", "sql", "docker", "redis"}));
    EXPECT_EQ(c->concept_set.size(), 5u);
    EXPECT_EQ(c->name, "Backend");
    ASSERT_TRUE(c->skill_level.has_value());
    EXPECT_EQ(*c->skill_level, "intermediate");
    EXPECT_TRUE(c->document_ids.empty());
}

TEST(ClusteringEngineTest, DefaultNames) {
    ClusteringEngine engine;
    const kb::ClusterId a = engine.create_cluster({"Graph Theory"}, "");
    const kb::ClusterId b = engine.create_cluster({}, "");

    EXPECT_EQ(engine.find_cluster(a)->name, "graph theory");
    EXPECT_EQ(engine.find_cluster(b)->name, "Cluster 1");
}

TEST(ClusteringEngineTest, MatchingUsesFullConceptList) {
    ClusteringEngine engine;
    const kb::ClusterId id = engine.create_cluster({"a1", "b1", "c1", "d1", "e1"}, "Letters");

    // first five entries are unrelated; only the tail overlaps (5/10)
    auto hit = engine.match_cluster({"v1", "w1", "x1", "y1", "z1", "a1", "b1", "c1", "d1", "e1"});
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, id);
}

TEST(ClusteringEngineTest, CaseAndUnicodeSpellingsCollapse) {
    ClusteringEngine engine;
    const kb::ClusterId id = engine.create_cluster({"Caf\xC3\xA9", "MACHINE learning"}, "ML");

    auto hit = engine.match_cluster({"cafe\xCC\x81", "machine  learning"});
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, id);

    std::set<std::string> doc = {"caf\xC3\xA9", "machine learning"};
    EXPECT_DOUBLE_EQ(engine.score(doc, nullptr, *engine.find_cluster(id)), 1.0);
}

TEST(ClusteringEngineTest, EmptyConceptsAlwaysCreate) {
    ClusteringEngine engine;
    engine.create_cluster({"python"}, "Web");

    EXPECT_FALSE(engine.match_cluster({}, std::string("Web")).has_value());

    const kb::ClusterId a = engine.assign(1, {}, std::string("Web"), std::nullopt);
    const kb::ClusterId b = engine.assign(2, {" ", ""}, std::nullopt, std::nullopt);
    EXPECT_NE(a, 0u);
    EXPECT_NE(a, b);
    EXPECT_EQ(engine.size(), 3u);
}

TEST(ClusteringEngineTest, TiesGoToLowestId) {
    ClusteringEngine engine;
    engine.create_cluster({"python", "flask"}, "First");
    engine.create_cluster({"python", "flask"}, "Second");

    auto hit = engine.match_cluster({"flask", "python"});
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, 0u);
}

TEST(ClusteringEngineTest, AssignMatchesOrCreates) {
    ClusteringEngine engine;

    const kb::ClusterId a = engine.assign(10, {"python", "fastapi"}, std::string("Web"), std::string("beginner"));
    const kb::ClusterId b = engine.assign(11, {"python", "flask"}, std::string("Web"), std::string("advanced"));
    const kb::ClusterId c = engine.assign(12, {"rust", "tokio"}, std::string("Async Rust"), std::nullopt);

    EXPECT_EQ(a, 0u);
    EXPECT_EQ(b, 0u);
    EXPECT_EQ(c, 1u);

    const cluster::Cluster* web = engine.find_cluster(a);
    EXPECT_EQ(web->document_ids, (std::set<kb::DocId>{10, 11}));
    EXPECT_EQ(web->name, "Web");
    // skill level is set once, at creation
    EXPECT_EQ(*web->skill_level, "beginner");
    // representative concepts do not drift with members
    EXPECT_EQ(web->concepts, (std::vector<std::string>{"python", "fastapi"}));

    EXPECT_EQ(engine.cluster_of(12), std::optional<kb::ClusterId>(1));
}

TEST(ClusteringEngineTest, ReassignMovesDocument) {
    ClusteringEngine engine;
    const kb::ClusterId a = engine.assign(7, {"python", "flask"}, std::nullopt, std::nullopt);
    const kb::ClusterId b = engine.assign(7, {"rust", "tokio"}, std::nullopt, std::nullopt);

    EXPECT_NE(a, b);
    EXPECT_EQ(engine.cluster_of(7), std::optional<kb::ClusterId>(b));
    EXPECT_TRUE(engine.find_cluster(a)->document_ids.empty());
    EXPECT_EQ(engine.find_cluster(b)->document_ids.count(7), 1u);
}

TEST(ClusteringEngineTest, ReassignIntoSameClusterKeepsOneMembership) {
    ClusteringEngine engine;
    const kb::ClusterId a = engine.assign(7, {"python", "flask"}, std::nullopt, std::nullopt);
    const kb::ClusterId again = engine.assign(7, {"python", "flask"}, std::nullopt, std::nullopt);

    EXPECT_EQ(a, again);
    EXPECT_EQ(engine.size(), 1u);
    EXPECT_EQ(engine.find_cluster(a)->document_ids, (std::set<kb::DocId>{7}));
    EXPECT_EQ(engine.cluster_of(7), std::optional<kb::ClusterId>(a));
}

TEST(ClusteringEngineTest, ReassignIntoNewClusterLeavesOldOneEmpty) {
    ClusteringEngine engine;
    const kb::ClusterId a = engine.assign(1, {"python", "flask"}, std::nullopt, std::nullopt);
    engine.assign(2, {"python", "flask"}, std::nullopt, std::nullopt);

    // no overlap with cluster a: a new cluster is created, then 1 moves
    const kb::ClusterId b = engine.assign(1, {"haskell"}, std::string("FP"), std::nullopt);

    EXPECT_NE(a, b);
    EXPECT_EQ(engine.find_cluster(a)->document_ids, (std::set<kb::DocId>{2}));
    EXPECT_EQ(engine.find_cluster(b)->document_ids, (std::set<kb::DocId>{1}));
    EXPECT_EQ(engine.cluster_of(1), std::optional<kb::ClusterId>(b));
    EXPECT_EQ(engine.cluster_of(2), std::optional<kb::ClusterId>(a));
}

TEST(ClusteringEngineTest, RemoveDocumentKeepsCluster) {
    ClusteringEngine engine;
    const kb::ClusterId id = engine.assign(1, {"python"}, std::nullopt, std::nullopt);

    engine.remove_document(1);
    engine.remove_document(1);
    engine.remove_document(999);

    EXPECT_FALSE(engine.cluster_of(1).has_value());
    ASSERT_NE(engine.find_cluster(id), nullptr);
    EXPECT_TRUE(engine.find_cluster(id)->document_ids.empty());
    EXPECT_EQ(engine.size(), 1u);

    // ids keep counting up
    EXPECT_EQ(engine.create_cluster({"go"}, "Go"), 1u);
    EXPECT_EQ(engine.create_cluster({"java"}, "Java"), 2u);
}

TEST(ClusteringEngineTest, RenameCluster) {
    ClusteringEngine engine;
    const kb::ClusterId id = engine.create_cluster({"python", "fastapi"}, "Web");

    EXPECT_THROW(engine.rename_cluster(42, "X"), kb::NotFoundError);
    EXPECT_THROW(engine.rename_cluster(id, "   "), kb::InvalidArgumentError);

    engine.rename_cluster(id, "Backend");
    EXPECT_EQ(engine.find_cluster(id)->name, "Backend");
    EXPECT_FALSE(engine.match_cluster({"python", "flask"}, std::string("Web")).has_value());
    EXPECT_TRUE(engine.match_cluster({"python", "flask"}, std::string("BACKEND")).has_value());
}

TEST(ClusteringEngineTest, InvalidConfigRejected) {
    ClusteringConfig cfg;
    cfg.max_concepts = 0;
    EXPECT_THROW(ClusteringEngine{cfg}, kb::InvalidArgumentError);

    ClusteringConfig neg;
    neg.name_boost = -0.1;
    EXPECT_THROW(ClusteringEngine{neg}, kb::InvalidArgumentError);
}

TEST(ClusteringEngineTest, KnowledgeAreasGroupRelatedClusters) {
    ClusteringEngine engine;
    engine.create_cluster({"python", "flask", "web"}, "Web");
    engine.create_cluster({"python", "flask", "django"}, "Django");
    engine.create_cluster({"rust", "tokio"}, "Rust");

    for (kb::DocId d : {0, 1, 2}) engine.assign(d, {"python", "flask", "web"}, std::nullopt, std::nullopt);
    for (kb::DocId d : {3, 4}) engine.assign(d, {"python", "flask", "django"}, std::nullopt, std::nullopt);
    engine.assign(5, {"rust", "tokio"}, std::nullopt, std::nullopt);

    ASSERT_EQ(engine.size(), 3u);
    auto areas = engine.detect_knowledge_areas();
    ASSERT_EQ(areas.size(), 2u);

    EXPECT_EQ(areas[0].name, "Web");
    EXPECT_EQ(areas[0].cluster_ids, (std::vector<kb::ClusterId>{0, 1}));
    EXPECT_EQ(areas[0].total_documents, 5u);
    EXPECT_EQ(areas[0].strength, "strong");
    EXPECT_EQ(areas[0].core_concepts, (std::vector<std::string>{"python", "flask", "web", "django"}));

    EXPECT_EQ(areas[1].name, "Rust");
    EXPECT_EQ(areas[1].cluster_ids, (std::vector<kb::ClusterId>{2}));
    EXPECT_EQ(areas[1].total_documents, 1u);
    EXPECT_EQ(areas[1].strength, "emerging");
}
