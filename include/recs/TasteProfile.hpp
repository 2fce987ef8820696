#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "jobs/ProgressReporter.hpp"
#include "recs/Models.hpp"
#include "store/LibraryStore.hpp"
#include "store/VectorStore.hpp"

namespace recs {

struct TasteConfig {
    // history is ordered best-first; weight decays linearly 1.0 -> (1 - position_decay)
    double position_decay = 0.3;

    // log2-normalized rewatch boost, up to +play_count_boost
    double play_count_boost = 0.4;

    // favorite multiplier shrinks as favorites become common
    double favorite_boost = 1.8;
    double favorite_boost_many = 1.5;   // > 10 favorites
    double favorite_boost_most = 1.3;   // > 20 favorites

    double critic_threshold = 7.5;
    double critic_step = 0.05;          // per point above 7

    double weight_cap_ratio = 3.0;      // no weight above cap_ratio * mean
};

// Multiplier for an explicit 1..10 user rating. Always >= 1, the weight of an unrated item.
double rating_multiplier(double user_rating);

// Per-item weights, aligned with `history`. 0 marks an entry with no usable signal
// (not a favorite, never played, unrated).
std::vector<double> history_weights(const std::vector<store::WatchHistoryEntry>& history,
                                    const store::LibraryStore& library,
                                    const TasteConfig& cfg = {});

// Weighted mean of the history's vectors, L2-normalized. std::nullopt when no entry with
// positive weight has a stored vector. Missing vectors are skipped and logged at debug.
std::optional<TasteProfile> build_taste_profile(const std::vector<store::WatchHistoryEntry>& history,
                                                const store::LibraryStore& library,
                                                const store::VectorStore& vectors,
                                                jobs::ProgressReporter& reporter,
                                                const TasteConfig& cfg = {});

}  // namespace recs
