#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <unordered_set>

#include "llm/MockLLMClient.hpp"
#include "similarity/GraphBuilder.hpp"

#include "Fakes.hpp"

namespace {

const std::string kSaga = "Saga Collection";

// "seed" plus s1..s25 in one 26-title collection, all pointing along axis 0 and drifting away
// from the seed as k grows. A series sits closer to the seed than any movie; two movies with no
// collection sit on their own axes.
class GraphBuilderTest : public ::testing::Test {
protected:
    static constexpr size_t kDim = 16;

    void SetUp() override {
        std::vector<std::pair<std::string, std::vector<float>>> vecs;
        for (int k = 0; k <= 25; ++k) {
            const std::string id = k == 0 ? "seed" : "s" + std::to_string(k);
            lib.add_item(fakes::movie(id, "Saga Tale #" + std::to_string(k), {"Sci-Fi", "Adventure"}, kSaga,
                                      1977 + k));
            vecs.emplace_back(id, fakes::axis_vec(kDim, 0, 0.02f * (float)k));
        }

        lib.add_item(fakes::series("show", "Saga Chronicles", {"Sci-Fi"}, "Network One"));
        vecs.emplace_back("show", fakes::axis_vec(kDim, 0, 0.005f));

        lib.add_item(fakes::movie("dune", "Dune", {"Sci-Fi"}, "", 2021));
        vecs.emplace_back("dune", fakes::axis_vec(kDim, 5));
        lib.add_item(fakes::movie("arrival", "Arrival", {"Drama", "Sci-Fi"}, "", 2016));
        vecs.emplace_back("arrival", fakes::axis_vec(kDim, 7));

        index = fakes::make_index(vecs);
    }

    similarity::GraphData build(const similarity::GraphOptions& opt,
                                const similarity::SimilarityPreferences& prefs = {},
                                const std::unordered_set<std::string>& watched = {},
                                llm::LLMClient* oracle = nullptr,
                                const jobs::StopToken& stop = {}) {
        validator = std::make_unique<similarity::ConnectionValidator>(cache, nullptr, fakes::no_sleep_retry(), rep);
        diverse = std::make_unique<similarity::DiverseContentFinder>(lib, oracle, fakes::no_sleep_retry(), rep);
        sizes = std::make_unique<similarity::CollectionSizeCache>(lib);
        similarity::SimilarityGraphBuilder builder(lib, index, *validator, *diverse, *sizes, rep);
        return builder.build("seed", opt, prefs, watched, stop);
    }

    size_t saga_nodes(const similarity::GraphData& g) const {
        size_t n = 0;
        for (const auto& node : g.nodes) {
            auto it = lib.get_item(node.id);
            if (it && it->collection_name && *it->collection_name == kSaga) ++n;
        }
        return n;
    }

    static void expect_unique_edges(const similarity::GraphData& g) {
        std::unordered_set<std::string> pairs;
        for (const auto& e : g.edges) {
            EXPECT_TRUE(pairs.insert(similarity::make_pair_key(e.source, e.target).str()).second)
                << e.source << " - " << e.target;
            EXPECT_NE(g.find_node(e.source), nullptr);
            EXPECT_NE(g.find_node(e.target), nullptr);
        }
    }

    store::InMemoryLibrary lib;
    store::EmbeddingIndex index;
    similarity::InMemoryValidationCache cache;
    jobs::RecordingProgressReporter rep;
    std::unique_ptr<similarity::ConnectionValidator> validator;
    std::unique_ptr<similarity::DiverseContentFinder> diverse;
    std::unique_ptr<similarity::CollectionSizeCache> sizes;
};

}  // namespace

TEST_F(GraphBuilderTest, DepthOneIsTheSeedAndItsNearestSameTypeNeighbors) {
    similarity::GraphOptions opt;
    opt.depth = 1;
    opt.limit = 6;
    auto g = build(opt);

    ASSERT_EQ(g.nodes.size(), 7u);
    EXPECT_EQ(g.nodes[0].id, "seed");
    EXPECT_TRUE(g.nodes[0].is_center);
    for (size_t i = 1; i < g.nodes.size(); ++i) {
        EXPECT_FALSE(g.nodes[i].is_center);
        EXPECT_EQ(g.nodes[i].type, store::MediaType::Movie);
    }
    EXPECT_EQ(g.find_node("show"), nullptr);
    EXPECT_NE(g.find_node("s1"), nullptr);
    EXPECT_NE(g.find_node("s6"), nullptr);

    ASSERT_EQ(g.edges.size(), 6u);
    for (const auto& e : g.edges) {
        EXPECT_EQ(e.source, "seed");
        ASSERT_FALSE(e.reasons.empty());
    }
    expect_unique_edges(g);
    EXPECT_FALSE(g.ai_escape_triggered);
}

TEST_F(GraphBuilderTest, LargeCollectionIsHeldToItsQuota) {
    similarity::GraphOptions opt;
    opt.depth = 2;
    opt.limit = 6;
    auto g = build(opt);

    // quota for 26 titles is 7, plus the seed itself
    EXPECT_LE(saga_nodes(g), 8u);
    EXPECT_LE(g.nodes.size(), similarity::max_nodes_for_depth(2, 6));
    expect_unique_edges(g);
}

TEST_F(GraphBuilderTest, FullFranchiseModeIgnoresTheQuota) {
    similarity::GraphOptions opt;
    opt.depth = 2;
    opt.limit = 6;
    similarity::SimilarityPreferences prefs;
    prefs.full_franchise_mode = true;
    auto g = build(opt, prefs);

    EXPECT_GT(saga_nodes(g), 8u);
    EXPECT_LE(g.nodes.size(), 25u);
    expect_unique_edges(g);
}

TEST_F(GraphBuilderTest, WatchedItemsAreHiddenUnlessAskedOtherwise) {
    similarity::GraphOptions opt;
    opt.depth = 1;
    opt.limit = 6;

    auto hidden = build(opt, {}, {"s1", "seed"});
    EXPECT_EQ(hidden.find_node("s1"), nullptr);
    // the seed is always shown
    EXPECT_NE(hidden.find_node("seed"), nullptr);

    similarity::SimilarityPreferences show;
    show.hide_watched = false;
    auto shown = build(opt, show, {"s1"});
    EXPECT_NE(shown.find_node("s1"), nullptr);
}

TEST_F(GraphBuilderTest, FranchiseBubbleIsEscapedWithOracleSuggestions) {
    llm::MockLLMClient mock;
    mock.set_default("1. Dune\n2. Arrival\n3. Not In Library");

    similarity::GraphOptions opt;
    opt.depth = 2;
    opt.limit = 6;
    auto g = build(opt, {}, {}, &mock);

    EXPECT_TRUE(g.ai_escape_triggered);
    EXPECT_EQ(g.ai_nodes_added, 2u);
    EXPECT_EQ(mock.calls(), 1u);
    ASSERT_NE(g.find_node("dune"), nullptr);
    ASSERT_NE(g.find_node("arrival"), nullptr);

    bool found = false;
    for (const auto& e : g.edges) {
        if (e.target != "dune") continue;
        found = true;
        EXPECT_EQ(e.source, "seed");
        EXPECT_DOUBLE_EQ(e.similarity, opt.ai_default_similarity);
        ASSERT_EQ(e.reasons.size(), 1u);
        EXPECT_EQ(e.reasons[0].type, similarity::ConnectionType::AiDiverse);
    }
    EXPECT_TRUE(found);
    expect_unique_edges(g);

    auto j = g.to_json();
    EXPECT_EQ(j["ai_escape"]["nodes_added"], 2);
    EXPECT_EQ(j["nodes"][0]["is_center"], true);
}

TEST_F(GraphBuilderTest, BubbleWithoutOracleStillBuilds) {
    similarity::GraphOptions opt;
    opt.depth = 2;
    opt.limit = 6;
    auto g = build(opt);

    EXPECT_TRUE(g.ai_escape_triggered);
    EXPECT_EQ(g.ai_nodes_added, 0u);
    EXPECT_EQ(g.find_node("dune"), nullptr);
}

TEST_F(GraphBuilderTest, UnknownSeedThrows) {
    validator = std::make_unique<similarity::ConnectionValidator>(cache, nullptr, fakes::no_sleep_retry(), rep);
    diverse = std::make_unique<similarity::DiverseContentFinder>(lib, nullptr, fakes::no_sleep_retry(), rep);
    sizes = std::make_unique<similarity::CollectionSizeCache>(lib);
    similarity::SimilarityGraphBuilder builder(lib, index, *validator, *diverse, *sizes, rep);

    EXPECT_THROW(builder.build("missing", similarity::GraphOptions{}), std::runtime_error);
}

TEST_F(GraphBuilderTest, StopRequestCancelsDeeperLevels) {
    similarity::GraphOptions opt;
    opt.depth = 3;
    jobs::StopToken stop;
    stop.request_stop();
    EXPECT_THROW(build(opt, {}, {}, nullptr, stop), jobs::OperationCancelled);
}

TEST_F(GraphBuilderTest, GraphIsWrittenAsJson) {
    similarity::GraphOptions opt;
    auto g = build(opt);

    const auto path = std::filesystem::temp_directory_path() / "media_recs_graph_test" / "graph.json";
    std::filesystem::remove_all(path.parent_path());
    g.write_to(path);

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    nlohmann::json j;
    in >> j;
    EXPECT_EQ(j["nodes"].size(), g.nodes.size());
    EXPECT_EQ(j["edges"].size(), g.edges.size());
    EXPECT_TRUE(j["edges"][0].contains("primary_connection_type"));
    std::filesystem::remove_all(path.parent_path());
}

TEST(GraphLimits, NodeCapGrowsWithDepth) {
    EXPECT_EQ(similarity::max_nodes_for_depth(1, 6), 7u);
    EXPECT_EQ(similarity::max_nodes_for_depth(1, 10), 11u);
    EXPECT_EQ(similarity::max_nodes_for_depth(2, 6), 25u);
    EXPECT_EQ(similarity::max_nodes_for_depth(3, 6), 45u);
}
