#include "similarity/SimilarityItem.hpp"

namespace similarity {

static std::optional<std::string> non_empty(const std::optional<std::string>& s) {
    if (!s || s->empty()) return std::nullopt;
    return s;
}

SimilarityItem to_similarity_item(const store::MediaItem& item) {
    SimilarityItem s;
    s.id = item.id;
    s.title = item.title;
    s.year = item.year;
    s.type = item.type;
    s.genres = item.genres;
    s.directors = item.directors;
    s.actors = item.actors;
    s.collection_name = non_empty(item.collection_name);
    s.network = non_empty(item.network);
    s.keywords = item.keywords;
    s.studios = item.studios;
    return s;
}

}  // namespace similarity
