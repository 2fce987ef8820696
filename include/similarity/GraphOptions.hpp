#pragma once

#include <cstddef>

namespace similarity {

struct GraphOptions {
    int limit = 6;   // neighbors per node at level 1
    int depth = 1;   // 1..3

    double bubble_threshold = 0.5;
    double ai_default_similarity = 0.5;
    int ai_min_suggestions = 4;
    size_t ai_exclude_titles = 15;  // titles listed in the escape prompt
};

// Per-user knobs; they change which nodes survive, not how the graph is expanded.
struct SimilarityPreferences {
    bool full_franchise_mode = false;
    bool hide_watched = true;
};

}  // namespace similarity
