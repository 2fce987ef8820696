#pragma once

#include <optional>
#include <string>
#include <vector>

#include "store/MediaItem.hpp"

namespace recs {

struct TasteProfile {
    std::vector<float> vector;  // unit length
    int source_count = 0;       // watched items that contributed
};

struct Candidate {
    std::string item_id;
    std::string title;
    int year = 0;
    store::MediaType type = store::MediaType::Movie;
    std::vector<std::string> genres;
    std::optional<std::string> network;  // series only
    std::optional<double> community_rating;
    double raw_similarity = 0.0;  // cosine against the taste vector, [-1,1]
};

struct ScoreBreakdown {
    double similarity = 0.0;
    double novelty = 0.0;
    double rating = 0.0;
    double diversity = 0.0;
    double final_score = 0.0;
};

struct ScoredCandidate : Candidate {
    ScoreBreakdown score;
};

struct SelectionDecision {
    std::string item_id;
    bool selected = false;
    int rank = 0;                  // 1..K for selected, K+1.. for the rest
    double adjusted_score = 0.0;   // score the selector ranked it with
};

struct SelectionResult {
    std::vector<ScoredCandidate> selected;     // rank order; copies carrying the selection-time diversity
    std::vector<ScoredCandidate> pool;         // the scored pool as given (de-duplicated)
    std::vector<SelectionDecision> decisions;  // one per pool entry, pool order
};

}  // namespace recs
