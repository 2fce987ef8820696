#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "jobs/ProgressReporter.hpp"
#include "jobs/StopToken.hpp"
#include "llm/LLMClient.hpp"
#include "recs/BackgroundTask.hpp"
#include "recs/Models.hpp"
#include "recs/PipelineConfig.hpp"
#include "store/LibraryStore.hpp"
#include "store/RecommendationStore.hpp"
#include "store/VectorStore.hpp"

namespace recs {

struct GenerationResult {
    std::string run_id;
    std::string user_id;
    store::RunStatus status = store::RunStatus::Running;
    std::vector<ScoredCandidate> recommendations;  // rank order
};

struct BatchSummary {
    int success = 0;
    int failed = 0;
    size_t total_recommendations = 0;
    std::vector<std::string> failed_users;

    nlohmann::json to_json() const;
};

struct RebuildSummary {
    size_t cleared_runs = 0;
    BatchSummary batch;

    nlohmann::json to_json() const;
};

// Called on a background thread after every completed run that produced recommendations.
using RunPublisher = std::function<void(const GenerationResult&)>;

class RecommendationService {
public:
    RecommendationService(const store::LibraryStore& library,
                          const store::VectorStore& vectors,
                          store::RecommendationStore& runs,
                          llm::LLMClient& oracle,
                          PipelineConfig cfg,
                          llm::RetryPolicy retry,
                          jobs::ProgressReporter& reporter);
    ~RecommendationService();

    // History -> taste -> candidates -> scores -> selection -> persisted run.
    // Empty history, no usable vectors or no candidates complete with an empty list.
    // Any other failure finalizes the run as failed and is rethrown.
    GenerationResult generate_for_user(const store::User& user, const jobs::StopToken& stop = jobs::StopToken());

    // Clears the user's previous runs, then generates. Serialized per user.
    GenerationResult regenerate_user(const std::string& user_id, const jobs::StopToken& stop = jobs::StopToken());

    // Every enabled user; a failing user is counted and the batch moves on.
    BatchSummary generate_for_all_users(const jobs::StopToken& stop = jobs::StopToken());

    RebuildSummary clear_and_rebuild_all(const jobs::StopToken& stop = jobs::StopToken());

    void set_publisher(RunPublisher publisher);
    // Joins every pending publisher task; returns the errors of those that failed.
    std::vector<std::string> wait_background();
    // Joins the tasks that already finished; returns how many are still running.
    size_t pending_background();

    const PipelineConfig& config() const { return cfg_; }

private:
    const store::LibraryStore& library_;
    const store::VectorStore& vectors_;
    store::RecommendationStore& runs_;
    llm::LLMClient& oracle_;
    PipelineConfig cfg_;
    llm::RetryPolicy retry_;
    jobs::ProgressReporter& reporter_;

    // generate/regenerate hold it shared, clear-all holds it exclusively
    std::shared_mutex admin_mu_;

    std::mutex user_mu_guard_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> user_mu_;

    std::mutex publish_mu_;
    RunPublisher publisher_;
    std::vector<std::unique_ptr<BackgroundTask>> background_;
    std::vector<std::string> background_errors_;  // from tasks reaped before wait_background

    void reap_finished_locked();

    std::mutex& user_mutex(const std::string& user_id);

    GenerationResult generate_locked(const store::User& user, const jobs::StopToken& stop);
    void publish(const GenerationResult& result);
};

}  // namespace recs
