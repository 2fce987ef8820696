#include "store/EmbeddingIndex.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>

#include "store/StoreError.hpp"

namespace store {

double cosine_similarity(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    return cosine_similarity(a.data(), b.data(), a.size());
}

bool l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return false;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
    return true;
}

void EmbeddingIndex::set(std::vector<std::string> item_ids, std::vector<float> vectors, size_t dim) {
    if (dim == 0 || vectors.size() != item_ids.size() * dim) {
        throw StoreError("EmbeddingIndex: vector data does not match ids x dim");
    }
    m_item_ids = std::move(item_ids);
    m_vecs = std::move(vectors);
    m_dim = dim;
    rebuild_slots();
}

void EmbeddingIndex::set_rating_levels(std::unordered_map<std::string, int> levels) {
    m_rating_levels = std::move(levels);
}

void EmbeddingIndex::rebuild_slots() {
    m_slot.clear();
    m_slot.reserve(m_item_ids.size() * 2 + 8);
    for (size_t i = 0; i < m_item_ids.size(); ++i) {
        // first occurrence wins
        m_slot.emplace(m_item_ids[i], i);
    }
}

std::vector<NeighborHit> EmbeddingIndex::nearest_neighbors(const std::vector<float>& query,
                                                           const std::unordered_set<std::string>& exclude,
                                                           size_t limit,
                                                           std::optional<int> max_rating) const {
    std::vector<NeighborHit> hits;
    if (m_dim == 0 || limit == 0) return hits;
    if (query.size() != m_dim) {
        throw StoreError("EmbeddingIndex: query dim " + std::to_string(query.size()) +
                         " != index dim " + std::to_string(m_dim));
    }

    hits.reserve(m_item_ids.size());
    for (size_t i = 0; i < m_item_ids.size(); ++i) {
        const std::string& id = m_item_ids[i];
        if (exclude.count(id)) continue;

        auto slot = m_slot.find(id);
        if (slot == m_slot.end() || slot->second != i) continue;

        if (max_rating) {
            auto lv = m_rating_levels.find(id);
            const int level = (lv == m_rating_levels.end()) ? 0 : lv->second;
            if (level > *max_rating) continue;
        }

        const float* v = &m_vecs[i * m_dim];
        hits.push_back({id, cosine_similarity(query.data(), v, m_dim)});
    }

    auto by_score = [](const NeighborHit& a, const NeighborHit& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.item_id < b.item_id;
    };

    const size_t k = std::min(limit, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + k, hits.end(), by_score);
    hits.resize(k);
    return hits;
}

std::optional<std::vector<float>> EmbeddingIndex::get_vector(const std::string& item_id) const {
    auto it = m_slot.find(item_id);
    if (it == m_slot.end()) return std::nullopt;
    const float* v = &m_vecs[it->second * m_dim];
    return std::vector<float>(v, v + m_dim);
}

void EmbeddingIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw StoreError("failed to open vector file for writing: " + path);

    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_item_ids.size();
    out.write((const char*)&dim, sizeof(dim));
    out.write((const char*)&n, sizeof(n));

    for (const auto& id : m_item_ids) {
        uint32_t len = (uint32_t)id.size();
        out.write((const char*)&len, sizeof(len));
        out.write(id.data(), len);
    }

    uint64_t vec_count = (uint64_t)m_vecs.size();
    out.write((const char*)&vec_count, sizeof(vec_count));
    out.write((const char*)m_vecs.data(), (std::streamsize)(sizeof(float) * m_vecs.size()));
    if (!out) throw StoreError("failed to write vector file: " + path);
}

void EmbeddingIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw StoreError("failed to open vector file: " + path);

    uint32_t dim = 0, n = 0;
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in || dim == 0) throw StoreError("corrupt vector file header: " + path);

    std::vector<std::string> ids;
    ids.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t len = 0;
        in.read((char*)&len, sizeof(len));
        if (!in) throw StoreError("truncated vector file (ids): " + path);
        std::string s(len, '\0');
        in.read(&s[0], len);
        if (!in) throw StoreError("truncated vector file (ids): " + path);
        ids.push_back(std::move(s));
    }

    uint64_t vec_count = 0;
    in.read((char*)&vec_count, sizeof(vec_count));
    if (!in || vec_count != (uint64_t)n * dim) throw StoreError("corrupt vector file body: " + path);

    std::vector<float> vecs((size_t)vec_count);
    in.read((char*)vecs.data(), (std::streamsize)(sizeof(float) * vecs.size()));
    if (!in) throw StoreError("truncated vector file (vectors): " + path);

    set(std::move(ids), std::move(vecs), dim);
}

}  // namespace store
