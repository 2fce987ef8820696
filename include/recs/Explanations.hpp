#pragma once

#include <map>
#include <string>
#include <vector>

#include "jobs/ProgressReporter.hpp"
#include "llm/LLMClient.hpp"
#include "recs/Models.hpp"
#include "store/RecommendationStore.hpp"

namespace recs {

struct EvidenceView {
    std::string title;
    int year = 0;
    double similarity = 0.0;
    store::EvidenceType type = store::EvidenceType::Watched;
};

struct ExplanationInput {
    ScoredCandidate candidate;
    std::string overview;
    std::vector<EvidenceView> evidence;  // most similar first
};

struct TasteContext {
    std::vector<std::string> top_genres;
    std::vector<std::string> favorite_titles;  // "Title (Year)"
};

// Deterministic text used whenever the oracle gives nothing usable.
std::string fallback_explanation(const ExplanationInput& in);

std::string build_explanation_prompt(const std::vector<ExplanationInput>& batch, const TasteContext& taste);

// Parses [{"index": 1, "explanation": "..."}] or {"explanations": [...]}; indexes are 1-based.
// Malformed text yields an empty map.
std::map<int, std::string> parse_explanations(const std::string& response);

class ExplanationWriter {
public:
    ExplanationWriter(llm::LLMClient& client, llm::RetryPolicy retry, size_t batch_size = 10);

    // One explanation per input, input order. Oracle failures fall back to the template
    // for the affected batch; a quota refusal stops further oracle calls.
    std::vector<store::Explanation> explain(const std::vector<ExplanationInput>& inputs,
                                            const TasteContext& taste,
                                            jobs::ProgressReporter& reporter);

private:
    llm::LLMClient& client_;
    llm::RetryPolicy retry_;
    size_t batch_size_;
};

}  // namespace recs
