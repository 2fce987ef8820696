#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "recs/Models.hpp"
#include "store/LibraryStore.hpp"

namespace recs {

struct ScoreWeights {
    double similarity = 0.4;
    double novelty = 0.2;
    double rating = 0.2;
    double diversity = 0.2;
};

// Genre occurrence counts over the most recent part of the watch history.
// Keys are lowercased genre names.
struct GenreProfile {
    std::map<std::string, int> counts;
    int total = 0;  // sum of counts
};

GenreProfile build_genre_profile(const std::vector<store::WatchHistoryEntry>& history,
                                 const store::LibraryStore& library,
                                 size_t max_items = 30);

// (raw + 1) / 2, clamped to [0,1]
double similarity_score(double raw_similarity);

// Rewards partial novelty: some unfamiliar genres next to familiar ones score best,
// all-new genres score lowest. No genres: 0.5.
double novelty_score(const std::vector<std::string>& genres, const GenreProfile& profile);

// Tiered 0..10 community rating -> [0,1]. Unrated: 0.4.
double rating_score(std::optional<double> community_rating);

double weighted_score(const ScoreBreakdown& s, const ScoreWeights& w);

// Scores every candidate; diversity is left at 0 for the selector to fill in.
// Result is sorted by final score descending, ties keep retrieval order.
std::vector<ScoredCandidate> score_candidates(const std::vector<Candidate>& candidates,
                                              const GenreProfile& genres,
                                              const ScoreWeights& weights);

}  // namespace recs
