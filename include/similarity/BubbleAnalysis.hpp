#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "similarity/SimilarityItem.hpp"

namespace similarity {

struct BubbleReport {
    bool is_bubbled = false;
    std::optional<std::string> dominant_collection;
    double dominant_percentage = 0.0;  // of all analyzed items, [0,1]
    size_t unique_collections = 0;
};

// Share of `items` in their most common collection. Ties go to the collection seen first.
// Items without a collection count toward the total but never dominate.
BubbleReport analyze_bubble(const std::vector<SimilarityItem>& items, double threshold = 0.5);

// How many members of a collection of `collection_size` known items may appear in one graph.
size_t collection_quota(size_t collection_size);

}  // namespace similarity
