#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "jobs/ProgressReporter.hpp"
#include "llm/LLMClient.hpp"
#include "similarity/SimilarityItem.hpp"
#include "similarity/ValidationCache.hpp"

namespace similarity {

struct ConnectionValidation {
    bool is_valid = false;
    std::string reason;
    bool from_cache = false;
};

// "Similar title pattern ... but unrelated content" when both titles share a sequel-style
// pattern (leading "Return of", trailing "II", ...) while their remaining cores are unrelated.
std::optional<std::string> detect_title_pattern_match(const std::string& title1, const std::string& title2);

// genres of b also present in a, case-insensitive
std::vector<std::string> shared_genres(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Same name, same franchise after dropping a trailing "collection", containment, or
// membership in one of the known franchise-alias groups.
bool collections_related(const std::string& c1, const std::string& c2);

std::string build_validation_prompt(const SimilarityItem& source, const SimilarityItem& target);

struct OracleVerdict {
    bool is_valid = false;
    std::string reason;
};

// "YES - both space operas" / "NO: different tone". Anything not starting with YES rejects.
OracleVerdict parse_oracle_verdict(const std::string& response);

// Title pattern filter, then genre gate, then collection-chain check. Unrelated collection
// pairs are answered from the cache, or by the oracle whose verdict is cached.
// Oracle failures reject without caching; after a quota refusal the oracle is not asked again.
class ConnectionValidator {
public:
    ConnectionValidator(ValidationCache& cache,
                        llm::LLMClient* oracle,
                        llm::RetryPolicy retry,
                        jobs::ProgressReporter& reporter);

    ConnectionValidation validate(const SimilarityItem& source, const SimilarityItem& target);

    size_t oracle_calls() const { return oracle_calls_.load(); }
    bool oracle_exhausted() const { return oracle_exhausted_.load(); }

private:
    ValidationCache& cache_;
    llm::LLMClient* oracle_;
    llm::RetryPolicy retry_;
    jobs::ProgressReporter& reporter_;

    std::atomic<size_t> oracle_calls_{0};
    std::atomic<bool> oracle_exhausted_{false};
};

}  // namespace similarity
