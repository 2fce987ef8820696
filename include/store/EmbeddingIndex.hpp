#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "store/VectorStore.hpp"

namespace store {

// Flat (exhaustive) cosine index over packed float vectors.
class EmbeddingIndex final : public VectorStore {
public:
    // vectors[i*dim .. (i+1)*dim) corresponds to item_ids[i]
    void set(std::vector<std::string> item_ids, std::vector<float> vectors, size_t dim);

    // Content-rating level per item (see content_rating_level); items absent here are level 0.
    void set_rating_levels(std::unordered_map<std::string, int> levels);

    std::vector<NeighborHit> nearest_neighbors(const std::vector<float>& query,
                                               const std::unordered_set<std::string>& exclude,
                                               size_t limit,
                                               std::optional<int> max_rating = std::nullopt) const override;

    std::optional<std::vector<float>> get_vector(const std::string& item_id) const override;

    // cache I/O (binary); save/load throw StoreError on I/O failure
    void save(const std::string& path) const;
    void load(const std::string& path);

    size_t dim() const { return m_dim; }
    size_t size() const { return m_item_ids.size(); }

private:
    size_t m_dim = 0;
    std::vector<std::string> m_item_ids;
    std::vector<float> m_vecs;  // packed: size = size()*dim()
    std::unordered_map<std::string, size_t> m_slot;
    std::unordered_map<std::string, int> m_rating_levels;

    void rebuild_slots();
};

}  // namespace store
