#include "recs/CandidateRetriever.hpp"

#include "util/TextUtil.hpp"

namespace recs {

std::string title_key(const std::string& title, int year) {
    return textutil::to_lower_copy(textutil::trim_copy(title)) + "|" + std::to_string(year);
}

CandidateRetriever::CandidateRetriever(const store::VectorStore& vectors, const store::LibraryStore& library)
    : vectors_(vectors), library_(library) {}

std::vector<Candidate> CandidateRetriever::retrieve(const std::vector<float>& taste,
                                                    const RetrievalRequest& request,
                                                    jobs::ProgressReporter& reporter) const {
    std::vector<Candidate> out;
    if (request.limit == 0 || taste.empty()) return out;

    // Hits are filtered by type and title after the store query, so over-fetch and widen
    // until enough survive or the store runs dry.
    size_t fetch = request.limit;
    for (;;) {
        out.clear();

        const auto hits = vectors_.nearest_neighbors(taste, request.exclude, fetch, request.max_rating);

        std::unordered_set<std::string> seen_ids;
        std::unordered_set<std::string> seen_titles;
        size_t missing = 0;

        for (const auto& hit : hits) {
            if (out.size() >= request.limit) break;
            if (request.exclude.count(hit.item_id)) continue;
            if (!seen_ids.insert(hit.item_id).second) continue;

            auto item = library_.get_item(hit.item_id);
            if (!item) {
                ++missing;
                continue;
            }
            if (item->type != request.type) continue;
            if (request.max_rating && store::content_rating_level(item->content_rating) > *request.max_rating) continue;

            if (request.dedupe_titles && !seen_titles.insert(title_key(item->title, item->year)).second) continue;

            Candidate c;
            c.item_id = item->id;
            c.title = item->title;
            c.year = item->year;
            c.type = item->type;
            c.genres = item->genres;
            c.network = item->network;
            c.community_rating = item->community_rating;
            c.raw_similarity = hit.similarity;
            out.push_back(std::move(c));
        }

        if (missing > 0) {
            reporter.debug(std::to_string(missing) + " vector hits have no library item");
        }

        if (out.size() >= request.limit || hits.size() < fetch) break;
        fetch *= 2;
    }

    return out;
}

}  // namespace recs
