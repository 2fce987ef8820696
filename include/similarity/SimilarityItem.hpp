#pragma once

#include <optional>
#include <string>
#include <vector>

#include "store/MediaItem.hpp"

namespace similarity {

// What the graph and the validator need to know about a content node.
struct SimilarityItem {
    std::string id;
    std::string title;
    int year = 0;
    store::MediaType type = store::MediaType::Movie;
    std::vector<std::string> genres;
    std::vector<std::string> directors;
    std::vector<store::Person> actors;
    std::optional<std::string> collection_name;
    std::optional<std::string> network;
    std::vector<std::string> keywords;
    std::vector<std::string> studios;
};

SimilarityItem to_similarity_item(const store::MediaItem& item);

}  // namespace similarity
