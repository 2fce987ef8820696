#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace store {

enum class RunStatus {
    Running,
    Completed,
    Failed
};

const char* run_status_str(RunStatus s);

struct RecommendationRun {
    std::string id;
    std::string user_id;
    std::int64_t started_at_ms = 0;
    int candidate_count = 0;
    int selected_count = 0;
    std::int64_t duration_ms = 0;
    RunStatus status = RunStatus::Running;
    std::optional<std::string> error_message;
};

struct CandidateRecord {
    std::string item_id;
    int pool_rank = 0;  // 1-based position in the scored pool
    bool is_selected = false;
    std::optional<int> selected_rank;

    double final_score = 0.0;
    double similarity = 0.0;
    double novelty = 0.0;
    double rating_score = 0.0;
    double diversity = 0.0;
};

enum class EvidenceType {
    Favorite,
    Rewatched,
    Watched
};

const char* evidence_type_str(EvidenceType t);

struct EvidenceLink {
    std::string candidate_item_id;
    std::string watched_item_id;
    double similarity = 0.0;
    EvidenceType type = EvidenceType::Watched;
};

struct Explanation {
    std::string item_id;
    std::string text;
    bool generated_by_llm = false;
};

// Write side of the relational store: runs and everything hanging off them.
class RecommendationStore {
public:
    virtual ~RecommendationStore() = default;

    virtual RecommendationRun create_run(const std::string& user_id) = 0;

    // Terminal transition; throws std::logic_error if the run is already completed or failed.
    virtual void finalize_run(const std::string& run_id,
                              RunStatus status,
                              int candidate_count,
                              int selected_count,
                              std::int64_t duration_ms,
                              const std::optional<std::string>& error_message) = 0;

    virtual void store_candidates(const std::string& run_id, const std::vector<CandidateRecord>& rows) = 0;
    virtual void store_evidence(const std::string& run_id, const std::vector<EvidenceLink>& links) = 0;
    virtual void store_explanations(const std::string& run_id, const std::vector<Explanation>& rows) = 0;
    virtual void store_taste_profile(const std::string& user_id, const std::vector<float>& vec) = 0;

    // returns number of runs removed
    virtual size_t clear_user(const std::string& user_id) = 0;
    virtual size_t clear_all() = 0;
    virtual size_t run_count() const = 0;

    virtual std::optional<RecommendationRun> get_run(const std::string& run_id) const = 0;
    virtual std::vector<RecommendationRun> runs_for_user(const std::string& user_id) const = 0;
    virtual std::vector<CandidateRecord> candidates(const std::string& run_id) const = 0;
    virtual std::vector<EvidenceLink> evidence(const std::string& run_id) const = 0;
    virtual std::vector<Explanation> explanations(const std::string& run_id) const = 0;
    virtual std::optional<std::vector<float>> taste_profile(const std::string& user_id) const = 0;
};

class InMemoryRecommendationStore final : public RecommendationStore {
public:
    RecommendationRun create_run(const std::string& user_id) override;
    void finalize_run(const std::string& run_id,
                      RunStatus status,
                      int candidate_count,
                      int selected_count,
                      std::int64_t duration_ms,
                      const std::optional<std::string>& error_message) override;

    void store_candidates(const std::string& run_id, const std::vector<CandidateRecord>& rows) override;
    void store_evidence(const std::string& run_id, const std::vector<EvidenceLink>& links) override;
    void store_explanations(const std::string& run_id, const std::vector<Explanation>& rows) override;
    void store_taste_profile(const std::string& user_id, const std::vector<float>& vec) override;

    size_t clear_user(const std::string& user_id) override;
    size_t clear_all() override;
    size_t run_count() const override;

    std::optional<RecommendationRun> get_run(const std::string& run_id) const override;
    std::vector<RecommendationRun> runs_for_user(const std::string& user_id) const override;
    std::vector<CandidateRecord> candidates(const std::string& run_id) const override;
    std::vector<EvidenceLink> evidence(const std::string& run_id) const override;
    std::vector<Explanation> explanations(const std::string& run_id) const override;
    std::optional<std::vector<float>> taste_profile(const std::string& user_id) const override;

private:
    mutable std::mutex m_mu;
    std::uint64_t m_next_id = 1;
    std::map<std::string, RecommendationRun> m_runs;  // ordered by id == creation order
    std::unordered_map<std::string, std::vector<CandidateRecord>> m_candidates;
    std::unordered_map<std::string, std::vector<EvidenceLink>> m_evidence;
    std::unordered_map<std::string, std::vector<Explanation>> m_explanations;
    std::unordered_map<std::string, std::vector<float>> m_taste;

    const RecommendationRun& require_run(const std::string& run_id) const;
    void erase_run_locked(const std::string& run_id);
};

}  // namespace store
