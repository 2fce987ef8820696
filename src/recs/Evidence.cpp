#include "recs/Evidence.hpp"

#include <algorithm>

namespace recs {

store::EvidenceType evidence_type_for(const store::WatchHistoryEntry& h) {
    if (h.is_favorite) return store::EvidenceType::Favorite;
    if (h.play_count > 1) return store::EvidenceType::Rewatched;
    return store::EvidenceType::Watched;
}

std::vector<store::EvidenceLink> collect_evidence(const std::vector<ScoredCandidate>& selected,
                                                  const std::vector<store::WatchHistoryEntry>& history,
                                                  const store::VectorStore& vectors,
                                                  size_t per_item) {
    std::vector<store::EvidenceLink> out;
    if (per_item == 0 || history.empty()) return out;

    struct Watched {
        const store::WatchHistoryEntry* entry;
        std::vector<float> vec;
    };
    std::vector<Watched> watched;
    watched.reserve(history.size());
    for (const auto& h : history) {
        auto v = vectors.get_vector(h.item_id);
        if (v) watched.push_back({&h, std::move(*v)});
    }
    if (watched.empty()) return out;

    for (const auto& c : selected) {
        auto cv = vectors.get_vector(c.item_id);
        if (!cv) continue;

        std::vector<store::EvidenceLink> links;
        links.reserve(watched.size());
        for (const auto& w : watched) {
            if (w.entry->item_id == c.item_id) continue;
            store::EvidenceLink l;
            l.candidate_item_id = c.item_id;
            l.watched_item_id = w.entry->item_id;
            l.similarity = store::cosine_similarity(*cv, w.vec);
            l.type = evidence_type_for(*w.entry);
            links.push_back(std::move(l));
        }

        const size_t k = std::min(per_item, links.size());
        std::partial_sort(links.begin(), links.begin() + k, links.end(),
                          [](const store::EvidenceLink& a, const store::EvidenceLink& b) {
                              if (a.similarity != b.similarity) return a.similarity > b.similarity;
                              return a.watched_item_id < b.watched_item_id;
                          });
        out.insert(out.end(), links.begin(), links.begin() + k);
    }
    return out;
}

}  // namespace recs
