#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "io/JsonIO.hpp"
#include "store/StoreError.hpp"

#include "Fakes.hpp"

using json = nlohmann::json;

TEST(JsonIO, NormalizePeopleAcceptsNamesObjectsAndMixedArrays) {
    auto people = io::normalize_people(json::parse(R"([
        "Harrison Ford",
        {"name": "Carrie Fisher", "role": "Leia", "thumb": "http://img/cf.jpg"},
        {"role": "nameless"},
        42
    ])"));

    ASSERT_EQ(people.size(), 2u);
    EXPECT_EQ(people[0].name, "Harrison Ford");
    EXPECT_TRUE(people[0].role.empty());
    EXPECT_EQ(people[1].name, "Carrie Fisher");
    EXPECT_EQ(people[1].role, "Leia");
    EXPECT_EQ(people[1].thumb, "http://img/cf.jpg");

    EXPECT_TRUE(io::normalize_people(json()).empty());
    EXPECT_TRUE(io::normalize_people(json::object()).empty());
}

TEST(JsonIO, NormalizeNamesAcceptsStringsAndNameObjects) {
    auto studios = io::normalize_names(json::parse(R"(["Lucasfilm", {"name": "Fox"}, {"id": 3}])"));
    ASSERT_EQ(studios.size(), 2u);
    EXPECT_EQ(studios[0], "Lucasfilm");
    EXPECT_EQ(studios[1], "Fox");
}

TEST(JsonIO, LibraryFromJsonLoadsItemsUsersAndHistory) {
    const json j = json::parse(R"({
        "items": [
            {"id": "m1", "title": "Heat", "year": 1995, "genres": ["Crime", "Drama"],
             "actors": [{"name": "Al Pacino"}], "studios": [{"name": "Warner"}],
             "collection_name": null, "community_rating": 8.3, "content_rating": "R"},
            {"id": "s1", "title": "The Wire", "type": "series", "network": "HBO", "genres": ["Crime"]}
        ],
        "users": [
            {"id": "u1", "username": "sam", "max_parental_rating": 7,
             "preferences": {"include_watched": true, "dislike_behavior": "include", "hide_watched": false},
             "history": [{"item_id": "m1", "play_count": 3, "is_favorite": true, "user_rating": 9}],
             "ratings": {"s1": 8},
             "dislikes": ["s1"]}
        ]
    })");

    store::InMemoryLibrary lib;
    io::library_from_json(j, lib);

    ASSERT_EQ(lib.item_count(), 2u);
    auto heat = lib.get_item("m1");
    ASSERT_TRUE(heat.has_value());
    EXPECT_EQ(heat->type, store::MediaType::Movie);
    EXPECT_FALSE(heat->collection_name.has_value());
    ASSERT_EQ(heat->actors.size(), 1u);
    EXPECT_EQ(heat->studios, std::vector<std::string>{"Warner"});
    EXPECT_DOUBLE_EQ(heat->community_rating.value_or(0), 8.3);

    auto wire = lib.get_item("s1");
    ASSERT_TRUE(wire.has_value());
    EXPECT_EQ(wire->type, store::MediaType::Series);
    EXPECT_EQ(wire->network.value_or(""), "HBO");

    auto user = lib.get_user("u1");
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->max_parental_rating.value_or(-1), 7);

    const auto prefs = lib.preferences("u1");
    EXPECT_TRUE(prefs.include_watched);
    EXPECT_EQ(prefs.dislike_behavior, store::DislikeBehavior::Include);
    EXPECT_FALSE(prefs.hide_watched);

    auto history = lib.watch_history("u1", store::MediaType::Movie, 10);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].play_count, 3);
    EXPECT_TRUE(history[0].is_favorite);

    EXPECT_EQ(lib.user_ratings("u1").at("s1"), 8.0);
    EXPECT_EQ(lib.disliked_ids("u1").count("s1"), 1u);
}

TEST(JsonIO, MalformedInputNamesTheOffendingPath) {
    store::InMemoryLibrary lib;
    try {
        io::library_from_json(json::parse(R"({"items": [{"id": "x", "title": 5}]})"), lib);
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("root.items[0].title"), std::string::npos);
    }

    EXPECT_THROW(io::library_from_json(json::parse(R"({"items": [{"id": "x", "title": "t", "type": "book"}]})"), lib),
                 std::runtime_error);
    EXPECT_THROW(io::library_from_json(json::parse(R"({"users": [{"id": "u", "preferences": {"dislike_behavior": "maybe"}}]})"), lib),
                 std::runtime_error);
}

TEST(JsonIO, LoadVectorsAttachesRatingLevels) {
    store::InMemoryLibrary lib;
    auto kids = fakes::movie("k", "Kids Film");
    kids.content_rating = "G";
    auto adult = fakes::movie("a", "Adult Film");
    adult.content_rating = "R";
    lib.add_item(kids);
    lib.add_item(adult);

    const auto path = std::filesystem::temp_directory_path() / "media_recs_jsonio_vectors.bin";
    fakes::make_index({{"k", {1.0f, 0.0f}}, {"a", {0.9f, 0.1f}}}).save(path.string());

    store::EmbeddingIndex idx = io::load_vectors(path.string(), lib);
    auto hits = idx.nearest_neighbors({1.0f, 0.0f}, {}, 10, store::content_rating_level("PG-13"));
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].item_id, "k");

    std::filesystem::remove(path);
}

TEST(JsonIO, MissingLibraryFileThrows) {
    store::InMemoryLibrary lib;
    EXPECT_THROW(io::load_library("/nonexistent/library.json", lib), std::runtime_error);
}
