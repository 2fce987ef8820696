#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace store {

struct NeighborHit {
    std::string item_id;
    double similarity = 0.0;  // cosine, [-1,1]
};

// One dense vector per content item, queried by cosine similarity.
class VectorStore {
public:
    virtual ~VectorStore() = default;

    // Up to `limit` hits ordered by descending similarity. Ids in `exclude` and items whose
    // content-rating level exceeds `max_rating` are never returned.
    virtual std::vector<NeighborHit> nearest_neighbors(const std::vector<float>& query,
                                                       const std::unordered_set<std::string>& exclude,
                                                       size_t limit,
                                                       std::optional<int> max_rating = std::nullopt) const = 0;

    virtual std::optional<std::vector<float>> get_vector(const std::string& item_id) const = 0;
};

double cosine_similarity(const float* a, const float* b, size_t dim);
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// In-place; returns false (and leaves v untouched) for a zero vector.
bool l2_normalize(std::vector<float>& v);

}  // namespace store
