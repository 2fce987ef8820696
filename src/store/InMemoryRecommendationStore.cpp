#include "store/RecommendationStore.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>

#include "store/StoreError.hpp"

namespace store {

const char* run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::Running: return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* evidence_type_str(EvidenceType t) {
    switch (t) {
        case EvidenceType::Favorite: return "favorite";
        case EvidenceType::Rewatched: return "rewatched";
        case EvidenceType::Watched: return "watched";
        default: return "unknown";
    }
}

static std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

RecommendationRun InMemoryRecommendationStore::create_run(const std::string& user_id) {
    std::lock_guard<std::mutex> lk(m_mu);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "run-%06llu", (unsigned long long)m_next_id++);

    RecommendationRun run;
    run.id = buf;
    run.user_id = user_id;
    run.started_at_ms = now_ms();
    run.status = RunStatus::Running;

    m_runs[run.id] = run;
    return run;
}

const RecommendationRun& InMemoryRecommendationStore::require_run(const std::string& run_id) const {
    auto it = m_runs.find(run_id);
    if (it == m_runs.end()) throw StoreError("unknown run: " + run_id);
    return it->second;
}

void InMemoryRecommendationStore::finalize_run(const std::string& run_id,
                                               RunStatus status,
                                               int candidate_count,
                                               int selected_count,
                                               std::int64_t duration_ms,
                                               const std::optional<std::string>& error_message) {
    if (status == RunStatus::Running) {
        throw std::logic_error("finalize_run: status must be completed or failed");
    }

    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_runs.find(run_id);
    if (it == m_runs.end()) throw StoreError("unknown run: " + run_id);

    RecommendationRun& run = it->second;
    if (run.status != RunStatus::Running) {
        throw std::logic_error("run " + run_id + " already finalized as " + run_status_str(run.status));
    }

    run.status = status;
    run.candidate_count = candidate_count;
    run.selected_count = selected_count;
    run.duration_ms = duration_ms;
    run.error_message = error_message;
}

void InMemoryRecommendationStore::store_candidates(const std::string& run_id,
                                                   const std::vector<CandidateRecord>& rows) {
    std::lock_guard<std::mutex> lk(m_mu);
    require_run(run_id);
    auto& dst = m_candidates[run_id];
    dst.insert(dst.end(), rows.begin(), rows.end());
}

void InMemoryRecommendationStore::store_evidence(const std::string& run_id,
                                                 const std::vector<EvidenceLink>& links) {
    std::lock_guard<std::mutex> lk(m_mu);
    require_run(run_id);
    auto& dst = m_evidence[run_id];
    dst.insert(dst.end(), links.begin(), links.end());
}

void InMemoryRecommendationStore::store_explanations(const std::string& run_id,
                                                     const std::vector<Explanation>& rows) {
    std::lock_guard<std::mutex> lk(m_mu);
    require_run(run_id);
    auto& dst = m_explanations[run_id];
    dst.insert(dst.end(), rows.begin(), rows.end());
}

void InMemoryRecommendationStore::store_taste_profile(const std::string& user_id,
                                                      const std::vector<float>& vec) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_taste[user_id] = vec;
}

void InMemoryRecommendationStore::erase_run_locked(const std::string& run_id) {
    m_candidates.erase(run_id);
    m_evidence.erase(run_id);
    m_explanations.erase(run_id);
    m_runs.erase(run_id);
}

size_t InMemoryRecommendationStore::clear_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lk(m_mu);

    std::vector<std::string> doomed;
    for (const auto& kv : m_runs) {
        if (kv.second.user_id == user_id) doomed.push_back(kv.first);
    }
    for (const auto& id : doomed) erase_run_locked(id);
    return doomed.size();
}

size_t InMemoryRecommendationStore::clear_all() {
    std::lock_guard<std::mutex> lk(m_mu);
    const size_t n = m_runs.size();
    m_runs.clear();
    m_candidates.clear();
    m_evidence.clear();
    m_explanations.clear();
    return n;
}

size_t InMemoryRecommendationStore::run_count() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_runs.size();
}

std::optional<RecommendationRun> InMemoryRecommendationStore::get_run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_runs.find(run_id);
    if (it == m_runs.end()) return std::nullopt;
    return it->second;
}

std::vector<RecommendationRun> InMemoryRecommendationStore::runs_for_user(const std::string& user_id) const {
    std::lock_guard<std::mutex> lk(m_mu);
    std::vector<RecommendationRun> out;
    for (const auto& kv : m_runs) {
        if (kv.second.user_id == user_id) out.push_back(kv.second);
    }
    return out;
}

template <class T>
static std::vector<T> rows_for(const std::unordered_map<std::string, std::vector<T>>& m, const std::string& run_id) {
    auto it = m.find(run_id);
    if (it == m.end()) return {};
    return it->second;
}

std::vector<CandidateRecord> InMemoryRecommendationStore::candidates(const std::string& run_id) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return rows_for(m_candidates, run_id);
}

std::vector<EvidenceLink> InMemoryRecommendationStore::evidence(const std::string& run_id) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return rows_for(m_evidence, run_id);
}

std::vector<Explanation> InMemoryRecommendationStore::explanations(const std::string& run_id) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return rows_for(m_explanations, run_id);
}

std::optional<std::vector<float>> InMemoryRecommendationStore::taste_profile(const std::string& user_id) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_taste.find(user_id);
    if (it == m_taste.end()) return std::nullopt;
    return it->second;
}

}  // namespace store
