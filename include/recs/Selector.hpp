#pragma once

#include <map>
#include <string>
#include <vector>

#include "recs/Models.hpp"

namespace recs {

struct SelectorConfig {
    int target_count = 50;
    double diversity_weight = 0.2;

    // series: split the boost 60/40 between genre and network diversity
    bool use_network_diversity = false;
};

// What has been picked so far. Keys are lowercased.
struct SelectionState {
    std::map<std::string, int> genres;
    std::map<std::string, int> networks;
    int count = 0;

    void add(const ScoredCandidate& c);
};

// Incremental diversity of `c` against the current selection, in [0,1].
double diversity_boost(const ScoredCandidate& c, const SelectionState& state, bool use_network_diversity);

// Greedy diversity-aware selection. The pool is never modified: each round recomputes
// every remaining candidate's adjusted score
//     final_score - w * diversity + w * diversity_boost
// and appends a copy of the best one (with diversity and final score updated) to the
// selection. Duplicate ids in the pool are dropped (first occurrence wins).
SelectionResult select_diverse(const std::vector<ScoredCandidate>& pool, const SelectorConfig& cfg);

}  // namespace recs
