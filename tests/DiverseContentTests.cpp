#include <gtest/gtest.h>

#include "llm/MockLLMClient.hpp"
#include "similarity/DiverseContent.hpp"

#include "Fakes.hpp"

namespace {

similarity::SimilarityItem center() {
    similarity::SimilarityItem c;
    c.id = "sw4";
    c.title = "A New Hope";
    c.year = 1977;
    c.genres = {"Sci-Fi", "Adventure"};
    c.keywords = {"space opera", "rebellion", "droid", "empire", "farm boy", "cantina"};
    c.collection_name = "Star Wars Collection";
    return c;
}

}  // namespace

TEST(DiverseContent, ParsesNumberedAndBulletedLines) {
    auto titles = similarity::parse_suggested_titles(
        "1. Dune\n2) Arrival\n- The Thing\n* Them!\n\xE2\x80\xA2 Tremors\n\n  X  \r\nBlade Runner\n");
    ASSERT_EQ(titles.size(), 6u);
    EXPECT_EQ(titles[0], "Dune");
    EXPECT_EQ(titles[1], "Arrival");
    EXPECT_EQ(titles[2], "The Thing");
    EXPECT_EQ(titles[3], "Them!");
    EXPECT_EQ(titles[4], "Tremors");
    EXPECT_EQ(titles[5], "Blade Runner");
}

TEST(DiverseContent, MatchesExactThenContainedThenFuzzyTitles) {
    std::vector<store::MediaItem> lib{
        fakes::movie("a", "Alien"),
        fakes::movie("b", "The Thing"),
        fakes::movie("c", "Heat"),
    };

    auto exact = similarity::match_title_to_library("HEAT", lib);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->id, "c");

    auto contained = similarity::match_title_to_library("Thing", lib);
    ASSERT_TRUE(contained.has_value());
    EXPECT_EQ(contained->id, "b");

    auto fuzzy = similarity::match_title_to_library("Aliens", lib);
    ASSERT_TRUE(fuzzy.has_value());
    EXPECT_EQ(fuzzy->id, "a");

    EXPECT_FALSE(similarity::match_title_to_library("Paddington", lib).has_value());
}

TEST(DiverseContent, PromptExcludesExistingTitlesAndCollections) {
    similarity::SimilarityItem other;
    other.title = "Empire Strikes Back";
    other.collection_name = "Star Wars Collection";
    similarity::SimilarityItem third;
    third.title = "Spaceballs";

    auto p = similarity::build_diverse_prompt(center(), {center(), other, third}, 5, 2);
    EXPECT_NE(p.find("Given the movie \"A New Hope\" (1977)"), std::string::npos);
    EXPECT_NE(p.find("Suggest 5 thematically similar movies"), std::string::npos);
    EXPECT_NE(p.find("A New Hope, Empire Strikes Back\n"), std::string::npos);
    EXPECT_EQ(p.find("Spaceballs"), std::string::npos);
    EXPECT_NE(p.find("ALSO EXCLUDE anything from: Star Wars Collection"), std::string::npos);
    // first five keywords only
    EXPECT_EQ(p.find("cantina"), std::string::npos);
}

TEST(DiverseContent, FinderKeepsSuggestionsFoundInTheLibrary) {
    store::InMemoryLibrary lib;
    lib.add_item(fakes::movie("dune", "Dune", {"Sci-Fi"}));
    lib.add_item(fakes::movie("arr", "Arrival", {"Sci-Fi"}));
    lib.add_item(fakes::series("dune-s", "Dune: Prophecy", {"Sci-Fi"}));

    llm::MockLLMClient mock;
    mock.set_default("1. Dune\n2. Interstellar\n3. DUNE\n4. Arrival");
    jobs::RecordingProgressReporter rep;
    similarity::DiverseContentFinder finder(lib, &mock, fakes::no_sleep_retry(), rep);

    auto r = finder.find(center(), {center()}, 4);
    EXPECT_TRUE(r.ai_suggested);
    ASSERT_EQ(r.items.size(), 2u);
    EXPECT_EQ(r.items[0].id, "dune");
    EXPECT_EQ(r.items[1].id, "arr");
    EXPECT_EQ(mock.calls(), 1u);
}

TEST(DiverseContent, FinderWithoutWorkingOracleReturnsNothing) {
    store::InMemoryLibrary lib;
    lib.add_item(fakes::movie("dune", "Dune", {"Sci-Fi"}));
    jobs::RecordingProgressReporter rep;

    similarity::DiverseContentFinder none(lib, nullptr, fakes::no_sleep_retry(), rep);
    auto a = none.find(center(), {}, 4);
    EXPECT_FALSE(a.ai_suggested);
    EXPECT_TRUE(a.items.empty());

    fakes::FailingLLMClient broken(fakes::FailingLLMClient::Kind::Other);
    similarity::DiverseContentFinder failing(lib, &broken, fakes::no_sleep_retry(), rep);
    auto b = failing.find(center(), {}, 4);
    EXPECT_FALSE(b.ai_suggested);
    EXPECT_TRUE(b.items.empty());
    EXPECT_GE(rep.count_at_least(jobs::LogLevel::Error), 1u);
}
