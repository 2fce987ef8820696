#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "store/LibraryStore.hpp"
#include "store/RecommendationStore.hpp"

namespace recs {

// JSON view of one persisted run: the ranked selection with sub-scores, evidence and
// explanations, plus the stored candidate window.
struct RunArtifact {
    store::RecommendationRun run;
    std::vector<store::CandidateRecord> candidates;
    std::vector<store::EvidenceLink> evidence;
    std::vector<store::Explanation> explanations;

    static RunArtifact load(const store::RecommendationStore& runs, const std::string& run_id);

    // titles are looked up in `library` when given
    nlohmann::json to_json(const store::LibraryStore* library = nullptr) const;
    void write_to(const std::filesystem::path& out_path, const store::LibraryStore* library = nullptr) const;
};

}  // namespace recs
