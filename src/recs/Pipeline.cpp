#include "recs/Pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "recs/CandidateRetriever.hpp"
#include "recs/Evidence.hpp"
#include "recs/Explanations.hpp"
#include "recs/Scorer.hpp"
#include "recs/Selector.hpp"
#include "recs/TasteProfile.hpp"

namespace recs {

namespace {

using Clock = std::chrono::steady_clock;

// Finalizes a run exactly once. A run still open when the guard dies is marked failed.
class RunGuard {
public:
    RunGuard(store::RecommendationStore& runs, std::string run_id, jobs::ProgressReporter& reporter)
        : runs_(runs), run_id_(std::move(run_id)), reporter_(reporter), start_(Clock::now()) {}

    ~RunGuard() {
        if (done_) return;
        try {
            finalize(store::RunStatus::Failed, 0, 0, std::string("run aborted"));
        } catch (const std::exception& e) {
            reporter_.error("could not finalize run " + run_id_ + ": " + e.what());
        }
    }

    void complete(int candidates, int selected) {
        finalize(store::RunStatus::Completed, candidates, selected, std::nullopt);
    }

    void fail(const std::string& message) {
        finalize(store::RunStatus::Failed, 0, 0, message);
    }

private:
    store::RecommendationStore& runs_;
    std::string run_id_;
    jobs::ProgressReporter& reporter_;
    Clock::time_point start_;
    bool done_ = false;

    void finalize(store::RunStatus status, int candidates, int selected, const std::optional<std::string>& err) {
        // set before the store call; the destructor does not retry
        done_ = true;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
        runs_.finalize_run(run_id_, status, candidates, selected, ms, err);
    }
};

std::vector<store::CandidateRecord> candidate_rows(const SelectionResult& sel, size_t limit) {
    std::unordered_map<std::string, const ScoredCandidate*> picked;
    std::unordered_map<std::string, int> picked_rank;
    for (size_t i = 0; i < sel.selected.size(); ++i) {
        picked[sel.selected[i].item_id] = &sel.selected[i];
        picked_rank[sel.selected[i].item_id] = (int)i + 1;
    }

    std::vector<store::CandidateRecord> rows;
    std::unordered_set<std::string> stored;

    auto row_for = [&](size_t pool_index) {
        const ScoredCandidate& c = sel.pool[pool_index];
        auto it = picked.find(c.item_id);
        const ScoredCandidate& src = (it == picked.end()) ? c : *it->second;

        store::CandidateRecord r;
        r.item_id = c.item_id;
        r.pool_rank = (int)pool_index + 1;
        r.is_selected = it != picked.end();
        if (r.is_selected) r.selected_rank = picked_rank[c.item_id];
        r.final_score = src.score.final_score;
        r.similarity = src.score.similarity;
        r.novelty = src.score.novelty;
        r.rating_score = src.score.rating;
        r.diversity = src.score.diversity;
        rows.push_back(r);
        stored.insert(c.item_id);
    };

    const size_t top = std::min(limit, sel.pool.size());
    for (size_t i = 0; i < top; ++i) row_for(i);

    // selection can reach past the stored window
    for (size_t i = top; i < sel.pool.size(); ++i) {
        if (picked.count(sel.pool[i].item_id) && !stored.count(sel.pool[i].item_id)) row_for(i);
    }
    return rows;
}

TasteContext taste_context(const std::vector<store::WatchHistoryEntry>& history,
                           const GenreProfile& genres,
                           const store::LibraryStore& library) {
    TasteContext ctx;

    std::vector<std::pair<std::string, int>> g(genres.counts.begin(), genres.counts.end());
    std::stable_sort(g.begin(), g.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    for (size_t i = 0; i < g.size() && i < 8; ++i) ctx.top_genres.push_back(g[i].first);

    for (const auto& h : history) {
        if (ctx.favorite_titles.size() >= 10) break;
        auto item = library.get_item(h.item_id);
        if (!item) continue;
        std::string t = item->title;
        if (item->year > 0) t += " (" + std::to_string(item->year) + ")";
        ctx.favorite_titles.push_back(std::move(t));
    }
    return ctx;
}

}  // namespace

nlohmann::json BatchSummary::to_json() const {
    return {
        {"success", success},
        {"failed", failed},
        {"total_recommendations", total_recommendations},
        {"failed_users", failed_users},
    };
}

nlohmann::json RebuildSummary::to_json() const {
    nlohmann::json j = batch.to_json();
    j["cleared_runs"] = cleared_runs;
    return j;
}

RecommendationService::RecommendationService(const store::LibraryStore& library,
                                             const store::VectorStore& vectors,
                                             store::RecommendationStore& runs,
                                             llm::LLMClient& oracle,
                                             PipelineConfig cfg,
                                             llm::RetryPolicy retry,
                                             jobs::ProgressReporter& reporter)
    : library_(library),
      vectors_(vectors),
      runs_(runs),
      oracle_(oracle),
      cfg_(std::move(cfg)),
      retry_(std::move(retry)),
      reporter_(reporter) {}

RecommendationService::~RecommendationService() {
    wait_background();
}

std::mutex& RecommendationService::user_mutex(const std::string& user_id) {
    std::lock_guard<std::mutex> lk(user_mu_guard_);
    auto& slot = user_mu_[user_id];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

GenerationResult RecommendationService::generate_for_user(const store::User& user, const jobs::StopToken& stop) {
    std::shared_lock<std::shared_mutex> admin(admin_mu_);
    std::lock_guard<std::mutex> lk(user_mutex(user.id));
    return generate_locked(user, stop);
}

GenerationResult RecommendationService::regenerate_user(const std::string& user_id, const jobs::StopToken& stop) {
    std::shared_lock<std::shared_mutex> admin(admin_mu_);
    std::lock_guard<std::mutex> lk(user_mutex(user_id));

    auto user = library_.get_user(user_id);
    if (!user) throw std::runtime_error("unknown user: " + user_id);

    const size_t cleared = runs_.clear_user(user_id);
    reporter_.info("cleared " + std::to_string(cleared) + " runs for " + user->username);
    return generate_locked(*user, stop);
}

GenerationResult RecommendationService::generate_locked(const store::User& user, const jobs::StopToken& stop) {
    const PipelineConfig& cfg = cfg_;
    const std::string kind = store::media_type_str(cfg.media_type);

    GenerationResult result;
    result.user_id = user.id;

    const store::RecommendationRun run = runs_.create_run(user.id);
    result.run_id = run.id;
    RunGuard guard(runs_, run.id, reporter_);

    reporter_.info("generating " + kind + " recommendations for " + user.username + " (" + run.id + ")");

    try {
        const store::UserPreferences prefs = library_.preferences(user.id);

        stop.throw_if_stopped("watch history");
        const auto history = library_.watch_history(user.id, cfg.media_type, cfg.recent_watch_limit);
        reporter_.info("history: " + std::to_string(history.size()) + " entries");

        if (history.empty()) {
            reporter_.warn("no watch history for " + user.username);
            guard.complete(0, 0);
            result.status = store::RunStatus::Completed;
            return result;
        }

        stop.throw_if_stopped("taste profile");
        auto taste = build_taste_profile(history, library_, vectors_, reporter_, cfg.taste);
        if (!taste) {
            reporter_.warn("no taste profile for " + user.username + " (watched items lack vectors)");
            guard.complete(0, 0);
            result.status = store::RunStatus::Completed;
            return result;
        }
        runs_.store_taste_profile(user.id, taste->vector);

        RetrievalRequest req;
        req.type = cfg.media_type;
        req.limit = cfg.max_candidates;
        req.max_rating = user.max_parental_rating;
        if (prefs.dislike_behavior == store::DislikeBehavior::Exclude) {
            req.exclude = library_.disliked_ids(user.id);
        }
        if (!prefs.include_watched) {
            for (const auto& id : library_.watched_ids(user.id, cfg.media_type)) req.exclude.insert(id);
        }

        stop.throw_if_stopped("candidates");
        CandidateRetriever retriever(vectors_, library_);
        const auto candidates = retriever.retrieve(taste->vector, req, reporter_);
        reporter_.info("candidates: " + std::to_string(candidates.size()) + " (excluded " +
                       std::to_string(req.exclude.size()) + ")");

        if (candidates.empty()) {
            reporter_.warn("no candidates for " + user.username);
            guard.complete(0, 0);
            result.status = store::RunStatus::Completed;
            return result;
        }

        stop.throw_if_stopped("scoring");
        const GenreProfile genres = build_genre_profile(history, library_, cfg.genre_profile_items);
        const auto scored = score_candidates(candidates, genres, cfg.weights);

        SelectorConfig scfg;
        scfg.target_count = cfg.selected_count;
        scfg.diversity_weight = cfg.weights.diversity;
        scfg.use_network_diversity = cfg.media_type == store::MediaType::Series;
        const SelectionResult sel = select_diverse(scored, scfg);

        for (size_t i = 0; i < sel.selected.size() && i < 10; ++i) {
            const auto& s = sel.selected[i];
            std::ostringstream line;
            line.precision(3);
            line << std::fixed << (i + 1) << ". " << s.title << " (" << s.year << ") " << s.score.final_score;
            reporter_.debug(line.str());
        }

        stop.throw_if_stopped("persist");
        runs_.store_candidates(run.id, candidate_rows(sel, cfg.stored_candidate_limit));
        const auto evidence = collect_evidence(sel.selected, history, vectors_, cfg.evidence_per_item);
        runs_.store_evidence(run.id, evidence);

        if (cfg.explanations_enabled && !sel.selected.empty()) {
            try {
                std::vector<ExplanationInput> inputs;
                inputs.reserve(sel.selected.size());
                for (const auto& s : sel.selected) {
                    ExplanationInput in;
                    in.candidate = s;
                    if (auto item = library_.get_item(s.item_id)) in.overview = item->overview;
                    for (const auto& ev : evidence) {
                        if (ev.candidate_item_id != s.item_id) continue;
                        auto w = library_.get_item(ev.watched_item_id);
                        if (!w) continue;
                        in.evidence.push_back(EvidenceView{w->title, w->year, ev.similarity, ev.type});
                    }
                    inputs.push_back(std::move(in));
                }

                ExplanationWriter writer(oracle_, retry_, cfg.explanation_batch_size);
                runs_.store_explanations(run.id, writer.explain(inputs, taste_context(history, genres, library_), reporter_));
            } catch (const jobs::OperationCancelled&) {
                throw;
            } catch (const std::exception& e) {
                reporter_.warn(std::string("explanations skipped: ") + e.what());
            }
        }

        guard.complete((int)sel.pool.size(), (int)sel.selected.size());
        result.status = store::RunStatus::Completed;
        result.recommendations = sel.selected;

        reporter_.info(user.username + ": " + std::to_string(sel.selected.size()) + " picks from " +
                       std::to_string(sel.pool.size()) + " candidates");
    } catch (const std::exception& e) {
        reporter_.error("recommendation generation failed for " + user.username + ": " + e.what());
        try {
            guard.fail(e.what());
        } catch (const std::exception& fe) {
            reporter_.error("could not finalize run " + run.id + ": " + fe.what());
        }
        throw;
    }

    publish(result);
    return result;
}

BatchSummary RecommendationService::generate_for_all_users(const jobs::StopToken& stop) {
    BatchSummary summary;

    reporter_.set_step(0, "Finding enabled users", 2);
    const auto users = library_.enabled_users();
    reporter_.info("found " + std::to_string(users.size()) + " enabled users");

    reporter_.set_step(1, "Generating recommendations", 2);
    for (size_t i = 0; i < users.size(); ++i) {
        stop.throw_if_stopped("batch");
        const auto& user = users[i];
        reporter_.update(i, users.size(), user.username);

        try {
            auto r = generate_for_user(user, stop);
            summary.success++;
            summary.total_recommendations += r.recommendations.size();
        } catch (const jobs::OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            summary.failed++;
            summary.failed_users.push_back(user.id);
            reporter_.error("user " + user.username + " failed: " + e.what());
        }
    }
    reporter_.update(users.size(), users.size(), "done");

    reporter_.complete(summary.to_json());
    return summary;
}

RebuildSummary RecommendationService::clear_and_rebuild_all(const jobs::StopToken& stop) {
    RebuildSummary out;
    {
        std::unique_lock<std::shared_mutex> admin(admin_mu_);
        const size_t existing = runs_.run_count();
        out.cleared_runs = runs_.clear_all();
        reporter_.info("cleared " + std::to_string(out.cleared_runs) + " of " + std::to_string(existing) + " runs");
    }
    out.batch = generate_for_all_users(stop);
    return out;
}

void RecommendationService::set_publisher(RunPublisher publisher) {
    std::lock_guard<std::mutex> lk(publish_mu_);
    publisher_ = std::move(publisher);
}

void RecommendationService::publish(const GenerationResult& result) {
    std::lock_guard<std::mutex> lk(publish_mu_);
    if (!publisher_ || result.recommendations.empty()) return;

    reap_finished_locked();
    RunPublisher fn = publisher_;
    background_.push_back(std::make_unique<BackgroundTask>(
        "publish " + result.run_id, [fn, result]() { fn(result); }, reporter_));
}

void RecommendationService::reap_finished_locked() {
    auto done = std::stable_partition(background_.begin(), background_.end(),
                                      [](const std::unique_ptr<BackgroundTask>& t) { return !t->finished(); });
    for (auto it = done; it != background_.end(); ++it) {
        (*it)->wait();
        if (auto err = (*it)->error()) background_errors_.push_back((*it)->name() + ": " + *err);
    }
    background_.erase(done, background_.end());
}

size_t RecommendationService::pending_background() {
    std::lock_guard<std::mutex> lk(publish_mu_);
    reap_finished_locked();
    return background_.size();
}

std::vector<std::string> RecommendationService::wait_background() {
    std::vector<std::unique_ptr<BackgroundTask>> tasks;
    std::vector<std::string> errors;
    {
        std::lock_guard<std::mutex> lk(publish_mu_);
        tasks.swap(background_);
        errors.swap(background_errors_);
    }

    for (auto& t : tasks) {
        t->wait();
        if (auto err = t->error()) errors.push_back(t->name() + ": " + *err);
    }
    return errors;
}

}  // namespace recs
