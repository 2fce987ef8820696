#include "recs/TasteProfile.hpp"

#include <algorithm>
#include <cmath>

namespace recs {

double rating_multiplier(double user_rating) {
    const double r = std::min(10.0, std::max(1.0, user_rating));
    return 1.0 + r / 10.0;
}

std::vector<double> history_weights(const std::vector<store::WatchHistoryEntry>& history,
                                    const store::LibraryStore& library,
                                    const TasteConfig& cfg) {
    std::vector<double> out(history.size(), 0.0);
    if (history.empty()) return out;

    int max_play = 1;
    int favorites = 0;
    for (const auto& h : history) {
        max_play = std::max(max_play, h.play_count);
        if (h.is_favorite) ++favorites;
    }

    const double fav_boost = favorites > 20   ? cfg.favorite_boost_most
                             : favorites > 10 ? cfg.favorite_boost_many
                                              : cfg.favorite_boost;
    const double total = (double)history.size();

    for (size_t i = 0; i < history.size(); ++i) {
        const auto& h = history[i];

        const bool has_signal = h.is_favorite || h.play_count > 0 || h.user_rating.has_value();
        if (!has_signal) continue;

        double w = 1.0 - ((double)i / total) * cfg.position_decay;

        if (h.play_count > 1) {
            const double norm = std::log2(h.play_count + 1.0) / std::log2(max_play + 1.0);
            w *= 1.0 + norm * cfg.play_count_boost;
        }

        if (h.is_favorite) w *= fav_boost;

        if (h.user_rating) w *= rating_multiplier(*h.user_rating);

        auto item = library.get_item(h.item_id);
        if (item && item->community_rating && *item->community_rating >= cfg.critic_threshold) {
            w *= 1.0 + (*item->community_rating - 7.0) * cfg.critic_step;
        }

        out[i] = w;
    }
    return out;
}

std::optional<TasteProfile> build_taste_profile(const std::vector<store::WatchHistoryEntry>& history,
                                                const store::LibraryStore& library,
                                                const store::VectorStore& vectors,
                                                jobs::ProgressReporter& reporter,
                                                const TasteConfig& cfg) {
    const std::vector<double> weights = history_weights(history, library, cfg);

    std::vector<std::vector<float>> vecs;
    std::vector<double> used;
    size_t missing = 0;

    for (size_t i = 0; i < history.size(); ++i) {
        if (weights[i] <= 0.0) continue;

        auto v = vectors.get_vector(history[i].item_id);
        if (!v || v->empty()) {
            ++missing;
            reporter.debug("no vector for watched item " + history[i].item_id);
            continue;
        }
        if (!vecs.empty() && v->size() != vecs.front().size()) {
            reporter.warn("vector dim mismatch for " + history[i].item_id + ", skipped");
            continue;
        }
        vecs.push_back(std::move(*v));
        used.push_back(weights[i]);
    }

    if (missing > 0) {
        reporter.info(std::to_string(missing) + " watched items have no vector");
    }
    if (vecs.empty()) return std::nullopt;

    double sum = 0.0;
    for (double w : used) sum += w;
    const double cap = (sum / (double)used.size()) * cfg.weight_cap_ratio;
    for (double& w : used) w = std::min(w, cap);

    const size_t dim = vecs.front().size();
    std::vector<double> acc(dim, 0.0);
    double wsum = 0.0;
    for (size_t k = 0; k < vecs.size(); ++k) {
        for (size_t d = 0; d < dim; ++d) acc[d] += used[k] * (double)vecs[k][d];
        wsum += used[k];
    }

    TasteProfile p;
    p.vector.resize(dim);
    for (size_t d = 0; d < dim; ++d) p.vector[d] = (float)(acc[d] / wsum);

    // vectors cancelled out exactly: nothing to point at
    if (!store::l2_normalize(p.vector)) {
        reporter.warn("taste vector has zero length");
        return std::nullopt;
    }

    p.source_count = (int)vecs.size();
    return p;
}

}  // namespace recs
