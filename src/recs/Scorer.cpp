#include "recs/Scorer.hpp"

#include <algorithm>

#include "util/TextUtil.hpp"

namespace recs {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

static std::string genre_key(const std::string& g) {
    return textutil::to_lower_copy(textutil::trim_copy(g));
}

GenreProfile build_genre_profile(const std::vector<store::WatchHistoryEntry>& history,
                                 const store::LibraryStore& library,
                                 size_t max_items) {
    GenreProfile p;
    const size_t n = std::min(max_items, history.size());
    for (size_t i = 0; i < n; ++i) {
        auto item = library.get_item(history[i].item_id);
        if (!item) continue;
        for (const auto& g : item->genres) {
            const std::string k = genre_key(g);
            if (k.empty()) continue;
            p.counts[k]++;
            p.total++;
        }
    }
    return p;
}

double similarity_score(double raw_similarity) {
    return clamp01((raw_similarity + 1.0) / 2.0);
}

double novelty_score(const std::vector<std::string>& genres, const GenreProfile& profile) {
    if (genres.empty()) return 0.5;

    double sum = 0.0;
    int novel = 0;
    for (const auto& g : genres) {
        auto it = profile.counts.find(genre_key(g));
        const int count = (it == profile.counts.end()) ? 0 : it->second;
        if (count == 0) ++novel;
        sum += profile.total == 0 ? 0.5 : 1.0 - (double)count / (double)profile.total;
    }

    const double avg = sum / (double)genres.size();
    const double ratio = (double)novel / (double)genres.size();

    if (ratio > 0.0 && ratio < 0.7) return 0.5 + avg * 0.4;
    if (ratio >= 0.7) return 0.3 + avg * 0.2;
    return 0.4 + avg * 0.2;
}

double rating_score(std::optional<double> community_rating) {
    if (!community_rating) return 0.4;

    const double r = std::min(10.0, std::max(0.0, *community_rating));
    if (r >= 8.0) return 0.8 + (r - 8.0) * 0.1;
    if (r >= 7.0) return 0.6 + (r - 7.0) * 0.2;
    if (r >= 6.0) return 0.4 + (r - 6.0) * 0.2;
    if (r >= 5.0) return 0.2 + (r - 5.0) * 0.2;
    return r / 25.0;
}

double weighted_score(const ScoreBreakdown& s, const ScoreWeights& w) {
    return w.similarity * s.similarity + w.novelty * s.novelty + w.rating * s.rating + w.diversity * s.diversity;
}

std::vector<ScoredCandidate> score_candidates(const std::vector<Candidate>& candidates,
                                              const GenreProfile& genres,
                                              const ScoreWeights& weights) {
    std::vector<ScoredCandidate> out;
    out.reserve(candidates.size());

    for (const auto& c : candidates) {
        ScoredCandidate sc;
        static_cast<Candidate&>(sc) = c;
        sc.score.similarity = similarity_score(c.raw_similarity);
        sc.score.novelty = novelty_score(c.genres, genres);
        sc.score.rating = rating_score(c.community_rating);
        sc.score.diversity = 0.0;
        sc.score.final_score = weighted_score(sc.score, weights);
        out.push_back(std::move(sc));
    }

    std::stable_sort(out.begin(), out.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        return a.score.final_score > b.score.final_score;
    });
    return out;
}

}  // namespace recs
