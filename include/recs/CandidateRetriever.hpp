#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "jobs/ProgressReporter.hpp"
#include "recs/Models.hpp"
#include "store/LibraryStore.hpp"
#include "store/VectorStore.hpp"

namespace recs {

struct RetrievalRequest {
    std::unordered_set<std::string> exclude;
    size_t limit = 500;
    std::optional<int> max_rating;  // content-rating level ceiling
    store::MediaType type = store::MediaType::Movie;

    // collapse "lower(title)|year" duplicates (editions of the same film)
    bool dedupe_titles = true;
};

class CandidateRetriever {
public:
    CandidateRetriever(const store::VectorStore& vectors, const store::LibraryStore& library);

    // Up to request.limit candidates ordered by descending raw similarity. Never returns an
    // excluded or duplicate id. An empty result is not an error.
    std::vector<Candidate> retrieve(const std::vector<float>& taste,
                                    const RetrievalRequest& request,
                                    jobs::ProgressReporter& reporter) const;

private:
    const store::VectorStore& vectors_;
    const store::LibraryStore& library_;
};

std::string title_key(const std::string& title, int year);

}  // namespace recs
