#include <gtest/gtest.h>

#include <unordered_set>

#include "jobs/ProgressReporter.hpp"
#include "recs/CandidateRetriever.hpp"

#include "Fakes.hpp"

namespace {

struct Library {
    store::InMemoryLibrary lib;
    store::EmbeddingIndex idx;
};

// 20 movies m0..m19 spread over 4 axes, plus two series
Library make_library() {
    Library l;
    std::vector<std::pair<std::string, std::vector<float>>> vecs;
    for (int i = 0; i < 20; ++i) {
        const std::string id = "m" + std::to_string(i);
        l.lib.add_item(fakes::movie(id, "Movie " + std::to_string(i), {"Drama"}, "", 2000 + i));
        vecs.push_back({id, fakes::axis_vec(4, (size_t)i % 4, 0.05f * (float)i)});
    }
    l.lib.add_item(fakes::series("s0", "Show 0"));
    l.lib.add_item(fakes::series("s1", "Show 1"));
    vecs.push_back({"s0", fakes::axis_vec(4, 0)});
    vecs.push_back({"s1", fakes::axis_vec(4, 0)});
    l.idx = fakes::make_index(vecs);
    return l;
}

}  // namespace

TEST(CandidateRetriever, NeverReturnsExcludedOrDuplicateIdsAndRespectsLimit) {
    Library l = make_library();
    recs::CandidateRetriever retriever(l.idx, l.lib);
    jobs::NullProgressReporter rep;

    for (size_t limit : {1u, 5u, 12u, 50u}) {
        recs::RetrievalRequest req;
        req.limit = limit;
        req.exclude = {"m0", "m4", "m8", "m13"};

        auto out = retriever.retrieve(fakes::axis_vec(4, 0), req, rep);
        EXPECT_LE(out.size(), limit);

        std::unordered_set<std::string> ids;
        for (const auto& c : out) {
            EXPECT_EQ(req.exclude.count(c.item_id), 0u);
            EXPECT_TRUE(ids.insert(c.item_id).second) << c.item_id;
            EXPECT_EQ(c.type, store::MediaType::Movie);
        }
        for (size_t i = 1; i < out.size(); ++i) EXPECT_GE(out[i - 1].raw_similarity, out[i].raw_similarity);
    }
}

TEST(CandidateRetriever, FiltersByMediaTypeEvenWhenOtherTypesRankFirst) {
    Library l = make_library();
    recs::CandidateRetriever retriever(l.idx, l.lib);
    jobs::NullProgressReporter rep;

    recs::RetrievalRequest req;
    req.limit = 2;
    req.type = store::MediaType::Series;
    auto out = retriever.retrieve(fakes::axis_vec(4, 2), req, rep);
    ASSERT_EQ(out.size(), 2u);
    for (const auto& c : out) EXPECT_EQ(c.type, store::MediaType::Series);
}

TEST(CandidateRetriever, RespectsContentRatingCeiling) {
    store::InMemoryLibrary lib;
    auto family = fakes::movie("f", "Family");
    family.content_rating = "PG";
    auto adult = fakes::movie("x", "Adult");
    adult.content_rating = "NC-17";
    lib.add_item(family);
    lib.add_item(adult);
    auto idx = fakes::make_index({{"f", {1.0f, 0.0f}}, {"x", {1.0f, 0.0f}}});

    recs::CandidateRetriever retriever(idx, lib);
    jobs::NullProgressReporter rep;
    recs::RetrievalRequest req;
    req.max_rating = store::content_rating_level("PG-13");

    auto out = retriever.retrieve({1.0f, 0.0f}, req, rep);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].item_id, "f");
}

TEST(CandidateRetriever, CollapsesEditionsOfTheSameTitle) {
    store::InMemoryLibrary lib;
    lib.add_item(fakes::movie("a1", "Blade Runner", {"Sci-Fi"}, "", 1982));
    lib.add_item(fakes::movie("a2", "blade runner ", {"Sci-Fi"}, "", 1982));
    lib.add_item(fakes::movie("b", "Blade Runner", {"Sci-Fi"}, "", 2049));
    auto idx = fakes::make_index({{"a1", {0.9f, 0.1f}}, {"a2", {1.0f, 0.0f}}, {"b", {0.5f, 0.5f}}});

    recs::CandidateRetriever retriever(idx, lib);
    jobs::NullProgressReporter rep;
    auto out = retriever.retrieve({1.0f, 0.0f}, recs::RetrievalRequest{}, rep);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].item_id, "a2");
    EXPECT_EQ(out[1].item_id, "b");
}

TEST(CandidateRetriever, EmptyStoreIsNotAnError) {
    store::InMemoryLibrary lib;
    store::EmbeddingIndex idx;
    recs::CandidateRetriever retriever(idx, lib);
    jobs::NullProgressReporter rep;
    EXPECT_TRUE(retriever.retrieve({1.0f, 0.0f}, recs::RetrievalRequest{}, rep).empty());
}
