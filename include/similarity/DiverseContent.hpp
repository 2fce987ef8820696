#pragma once

#include <optional>
#include <string>
#include <vector>

#include "jobs/ProgressReporter.hpp"
#include "llm/LLMClient.hpp"
#include "similarity/SimilarityItem.hpp"
#include "store/LibraryStore.hpp"

namespace similarity {

struct DiverseResult {
    std::vector<SimilarityItem> items;
    bool ai_suggested = false;  // false when the oracle was unavailable or failed
};

std::string build_diverse_prompt(const SimilarityItem& center,
                                 const std::vector<SimilarityItem>& existing,
                                 size_t limit,
                                 size_t max_exclude_titles = 15);

// One title per non-empty line; list numbering and bullets are stripped.
std::vector<std::string> parse_suggested_titles(const std::string& response);

// Exact (case-insensitive) title first, otherwise the closest title by trigram similarity among
// those containing the suggestion or scoring above 0.5.
std::optional<store::MediaItem> match_title_to_library(const std::string& title,
                                                        const std::vector<store::MediaItem>& library_items);

// Asks the oracle for thematically similar titles outside the collections already in the graph,
// keeping the ones that exist in the library.
class DiverseContentFinder {
public:
    DiverseContentFinder(const store::LibraryStore& library,
                         llm::LLMClient* oracle,
                         llm::RetryPolicy retry,
                         jobs::ProgressReporter& reporter,
                         size_t max_exclude_titles = 15);

    DiverseResult find(const SimilarityItem& center, const std::vector<SimilarityItem>& existing, size_t limit);

private:
    const store::LibraryStore& library_;
    llm::LLMClient* oracle_;
    llm::RetryPolicy retry_;
    jobs::ProgressReporter& reporter_;
    size_t max_exclude_titles_;
};

}  // namespace similarity
