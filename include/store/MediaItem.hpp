#pragma once

#include <optional>
#include <string>
#include <vector>

namespace store {

enum class MediaType {
    Movie,
    Series
};

const char* media_type_str(MediaType t);

// Accepts "movie" / "series" (case-insensitive). Throws std::runtime_error otherwise.
MediaType parse_media_type(const std::string& s);

// Actors arrive either as bare names or as {name, role, thumb} objects; both are
// normalized into this record when the library is loaded.
struct Person {
    std::string name;
    std::string role;
    std::string thumb;
};

struct MediaItem {
    std::string id;
    std::string title;
    int year = 0;  // 0 = unknown
    MediaType type = MediaType::Movie;

    std::vector<std::string> genres;
    std::vector<std::string> directors;
    std::vector<Person> actors;
    std::vector<std::string> keywords;
    std::vector<std::string> studios;

    std::optional<std::string> collection_name;  // movies
    std::optional<std::string> network;          // series

    std::optional<double> community_rating;  // 0..10
    std::string content_rating;              // "PG-13", "TV-MA", ...
    std::string overview;
};

// Numeric level for a content rating name ("G" = 1 ... "NC-17" = 10).
// Unknown or empty ratings map to 0, i.e. they never exceed a ceiling.
int content_rating_level(const std::string& rating_name);

}  // namespace store
