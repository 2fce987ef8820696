#include "similarity/BubbleAnalysis.hpp"

#include <algorithm>
#include <unordered_map>

namespace similarity {

BubbleReport analyze_bubble(const std::vector<SimilarityItem>& items, double threshold) {
    BubbleReport r;
    if (items.empty()) return r;

    std::vector<std::string> order;
    std::unordered_map<std::string, size_t> counts;
    for (const auto& it : items) {
        if (!it.collection_name) continue;
        auto [pos, inserted] = counts.emplace(*it.collection_name, 0);
        if (inserted) order.push_back(*it.collection_name);
        ++pos->second;
    }
    r.unique_collections = counts.size();

    size_t best = 0;
    for (const auto& name : order) {
        if (counts[name] > best) {
            best = counts[name];
            r.dominant_collection = name;
        }
    }

    r.dominant_percentage = (double)best / (double)items.size();
    r.is_bubbled = best > 0 && r.dominant_percentage >= threshold;
    return r;
}

size_t collection_quota(size_t collection_size) {
    if (collection_size <= 5) return collection_size;
    if (collection_size <= 15) return std::max<size_t>(3, collection_size / 2);
    const size_t thirty = (collection_size * 3) / 10;
    return std::min<size_t>(8, std::max<size_t>(5, thirty));
}

}  // namespace similarity
