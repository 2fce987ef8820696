#include "store/MediaItem.hpp"

#include <stdexcept>
#include <unordered_map>

#include "util/TextUtil.hpp"

namespace store {

const char* media_type_str(MediaType t) {
    switch (t) {
        case MediaType::Movie: return "movie";
        case MediaType::Series: return "series";
        default: return "unknown";
    }
}

MediaType parse_media_type(const std::string& s) {
    const std::string k = textutil::to_lower_copy(textutil::trim_copy(s));
    if (k == "movie" || k == "movies") return MediaType::Movie;
    if (k == "series" || k == "show" || k == "tv") return MediaType::Series;
    throw std::runtime_error("unknown media type: " + s);
}

int content_rating_level(const std::string& rating_name) {
    static const std::unordered_map<std::string, int> levels = {
        {"g", 1},      {"tv-y", 1},   {"tv-g", 1},
        {"tv-y7", 3},  {"tv-y7-fv", 3},
        {"pg", 5},     {"tv-pg", 5},
        {"pg-13", 7},  {"tv-14", 7},
        {"r", 9},      {"tv-ma", 9},
        {"nc-17", 10}, {"x", 10},     {"xxx", 10},
        {"nr", 0},     {"unrated", 0}, {"not rated", 0},
    };

    const std::string k = textutil::to_lower_copy(textutil::trim_copy(rating_name));
    if (k.empty()) return 0;

    auto it = levels.find(k);
    if (it != levels.end()) return it->second;

    // Country-prefixed forms like "US-PG-13".
    const auto dash = k.find('-');
    if (dash != std::string::npos && dash <= 3) {
        auto it2 = levels.find(k.substr(dash + 1));
        if (it2 != levels.end()) return it2->second;
    }
    return 0;
}

}  // namespace store
