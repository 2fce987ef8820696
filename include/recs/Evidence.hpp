#pragma once

#include <string>
#include <vector>

#include "recs/Models.hpp"
#include "store/LibraryStore.hpp"
#include "store/RecommendationStore.hpp"
#include "store/VectorStore.hpp"

namespace recs {

store::EvidenceType evidence_type_for(const store::WatchHistoryEntry& h);

// For every selected candidate, the `per_item` watched items whose vectors are most similar
// to the candidate's vector. Candidates or watched items without vectors contribute nothing.
std::vector<store::EvidenceLink> collect_evidence(const std::vector<ScoredCandidate>& selected,
                                                  const std::vector<store::WatchHistoryEntry>& history,
                                                  const store::VectorStore& vectors,
                                                  size_t per_item = 3);

}  // namespace recs
