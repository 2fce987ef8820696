#include "recs/Selector.hpp"

#include <algorithm>
#include <unordered_set>

#include "util/TextUtil.hpp"

namespace recs {

static std::string key_of(const std::string& s) {
    return textutil::to_lower_copy(textutil::trim_copy(s));
}

void SelectionState::add(const ScoredCandidate& c) {
    for (const auto& g : c.genres) genres[key_of(g)]++;
    if (c.network && !c.network->empty()) networks[key_of(*c.network)]++;
    ++count;
}

static double genre_diversity(const ScoredCandidate& c, const SelectionState& state) {
    int overlap = 0;
    for (const auto& g : c.genres) {
        if (state.genres.count(key_of(g))) ++overlap;
    }
    return 1.0 - (double)overlap / (double)c.genres.size();
}

double diversity_boost(const ScoredCandidate& c, const SelectionState& state, bool use_network_diversity) {
    double boost = 0.0;

    const bool has_genres = !c.genres.empty();
    const double gd = has_genres ? genre_diversity(c, state) : 0.0;

    boost += has_genres ? gd * 0.6 : 0.3;

    if (use_network_diversity) {
        if (c.network && !c.network->empty() && state.count > 0) {
            auto it = state.networks.find(key_of(*c.network));
            const int n = (it == state.networks.end()) ? 0 : it->second;
            boost += (1.0 - (double)n / (double)state.count) * 0.4;
        } else {
            boost += 0.2;
        }
    } else {
        // movies: genre diversity carries the full weight
        boost += has_genres ? gd * 0.4 : 0.2;
    }

    return boost;
}

static double adjusted_score(const ScoredCandidate& c, double boost, double w) {
    return c.score.final_score - w * c.score.diversity + w * boost;
}

SelectionResult select_diverse(const std::vector<ScoredCandidate>& pool, const SelectorConfig& cfg) {
    SelectionResult res;

    {
        std::unordered_set<std::string> ids;
        ids.reserve(pool.size() * 2 + 8);
        for (const auto& c : pool) {
            if (ids.insert(c.item_id).second) res.pool.push_back(c);
        }
    }

    const size_t n = res.pool.size();
    const size_t target = cfg.target_count <= 0 ? 0 : std::min((size_t)cfg.target_count, n);
    const double w = cfg.diversity_weight;

    std::vector<bool> taken(n, false);
    std::vector<int> rank(n, 0);
    std::vector<double> adjusted(n, 0.0);
    SelectionState state;

    while (res.selected.size() < target) {
        int best = -1;
        double best_score = 0.0;
        double best_boost = 0.0;

        for (size_t i = 0; i < n; ++i) {
            if (taken[i]) continue;
            const double boost = diversity_boost(res.pool[i], state, cfg.use_network_diversity);
            const double s = adjusted_score(res.pool[i], boost, w);
            // strict '>' keeps the earlier pool entry on ties
            if (best < 0 || s > best_score) {
                best = (int)i;
                best_score = s;
                best_boost = boost;
            }
        }
        if (best < 0) break;

        taken[best] = true;
        adjusted[best] = best_score;

        ScoredCandidate pick = res.pool[best];
        pick.score.diversity = best_boost;
        pick.score.final_score = best_score;
        state.add(pick);
        res.selected.push_back(std::move(pick));
        rank[best] = (int)res.selected.size();
    }

    // Rank the rest by what they would score against the final selection.
    std::vector<size_t> rest;
    for (size_t i = 0; i < n; ++i) {
        if (taken[i]) continue;
        const double boost = diversity_boost(res.pool[i], state, cfg.use_network_diversity);
        adjusted[i] = adjusted_score(res.pool[i], boost, w);
        rest.push_back(i);
    }
    std::stable_sort(rest.begin(), rest.end(), [&](size_t a, size_t b) { return adjusted[a] > adjusted[b]; });

    int next = (int)res.selected.size();
    for (size_t i : rest) rank[i] = ++next;

    res.decisions.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        res.decisions.push_back(SelectionDecision{res.pool[i].item_id, (bool)taken[i], rank[i], adjusted[i]});
    }
    return res;
}

}  // namespace recs
