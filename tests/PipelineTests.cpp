#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <unordered_set>

#include "llm/MockLLMClient.hpp"
#include "recs/Pipeline.hpp"
#include "recs/Scorer.hpp"

#include "Fakes.hpp"

namespace {

const std::vector<std::string> kGenres{"Drama", "Comedy", "Horror", "Sci-Fi", "Western", "Crime"};

store::User user(const std::string& id) {
    store::User u;
    u.id = id;
    u.username = id + "-name";
    return u;
}

// Throws from watch_history for one user; everything else goes to the wrapped library.
class FailingHistoryLibrary final : public store::LibraryStore {
public:
    FailingHistoryLibrary(const store::LibraryStore& inner, std::string bad_user)
        : inner_(inner), bad_user_(std::move(bad_user)) {}

    std::optional<store::MediaItem> get_item(const std::string& id) const override { return inner_.get_item(id); }
    std::vector<store::MediaItem> items_of_type(store::MediaType t) const override { return inner_.items_of_type(t); }
    size_t collection_size(const std::string& c) const override { return inner_.collection_size(c); }
    std::vector<store::User> enabled_users() const override { return inner_.enabled_users(); }
    std::optional<store::User> get_user(const std::string& id) const override { return inner_.get_user(id); }
    store::UserPreferences preferences(const std::string& id) const override { return inner_.preferences(id); }

    std::vector<store::WatchHistoryEntry> watch_history(const std::string& id,
                                                        store::MediaType t,
                                                        size_t limit) const override {
        if (id == bad_user_) throw store::StoreError("history table locked");
        return inner_.watch_history(id, t, limit);
    }

    std::unordered_set<std::string> watched_ids(const std::string& id, store::MediaType t) const override {
        return inner_.watched_ids(id, t);
    }
    std::map<std::string, double> user_ratings(const std::string& id) const override { return inner_.user_ratings(id); }
    std::unordered_set<std::string> disliked_ids(const std::string& id) const override { return inner_.disliked_ids(id); }

private:
    const store::LibraryStore& inner_;
    std::string bad_user_;
};

class PipelineTest : public ::testing::Test {
protected:
    static constexpr size_t kDim = 8;
    static constexpr size_t kMovies = 55;

    void SetUp() override {
        std::vector<std::pair<std::string, std::vector<float>>> vecs;
        for (size_t i = 0; i < kMovies; ++i) {
            const std::string id = "m" + std::to_string(i);
            auto m = fakes::movie(id, "Title " + std::to_string(i), {kGenres[i % kGenres.size()]}, "", 1980 + (int)i);
            m.community_rating = 5.0 + (double)(i % 5);
            m.overview = "Overview of title " + std::to_string(i);
            lib.add_item(m);
            vecs.emplace_back(id, fakes::axis_vec(kDim, i % kDim, 0.05f * (float)(i / kDim)));
        }
        index = fakes::make_index(vecs);

        lib.add_user(user("u1"));
        for (int i = 0; i < 5; ++i) lib.add_watch("u1", fakes::watched("m" + std::to_string(i), 2, i == 0));

        cfg.selected_count = 10;
        cfg.explanation_batch_size = 5;
    }

    recs::RecommendationService service(const store::LibraryStore& library, const store::VectorStore& vectors) {
        return recs::RecommendationService(library, vectors, runs, oracle, cfg, fakes::no_sleep_retry(), rep);
    }

    store::InMemoryLibrary lib;
    store::EmbeddingIndex index;
    store::InMemoryRecommendationStore runs;
    llm::NullLLMClient oracle;
    recs::PipelineConfig cfg;
    jobs::RecordingProgressReporter rep;
};

}  // namespace

TEST_F(PipelineTest, UserWithoutHistoryCompletesEmpty) {
    lib.add_user(user("fresh"));
    auto svc = service(lib, index);

    auto r = svc.generate_for_user(user("fresh"));
    EXPECT_EQ(r.status, store::RunStatus::Completed);
    EXPECT_TRUE(r.recommendations.empty());

    auto run = runs.get_run(r.run_id);
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->status, store::RunStatus::Completed);
    EXPECT_EQ(run->selected_count, 0);
    EXPECT_FALSE(run->error_message.has_value());
}

TEST_F(PipelineTest, HistoryWithoutVectorsCompletesEmpty) {
    store::EmbeddingIndex empty;
    auto svc = service(lib, empty);

    auto r = svc.generate_for_user(user("u1"));
    EXPECT_EQ(r.status, store::RunStatus::Completed);
    EXPECT_TRUE(r.recommendations.empty());
    EXPECT_FALSE(runs.taste_profile("u1").has_value());
}

TEST_F(PipelineTest, SelectsDistinctUnwatchedItemsWithWeightedScores) {
    auto svc = service(lib, index);
    auto r = svc.generate_for_user(user("u1"));

    ASSERT_EQ(r.status, store::RunStatus::Completed);
    ASSERT_EQ(r.recommendations.size(), 10u);

    std::unordered_set<std::string> ids;
    for (const auto& s : r.recommendations) {
        EXPECT_TRUE(ids.insert(s.item_id).second) << s.item_id;
        for (int i = 0; i < 5; ++i) EXPECT_NE(s.item_id, "m" + std::to_string(i));
        EXPECT_NEAR(s.score.final_score, recs::weighted_score(s.score, cfg.weights), 1e-9);
    }

    auto run = runs.get_run(r.run_id);
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->candidate_count, 50);
    EXPECT_EQ(run->selected_count, 10);

    auto rows = runs.candidates(r.run_id);
    EXPECT_EQ(rows.size(), 50u);
    std::unordered_set<std::string> row_ids;
    int selected_rows = 0;
    for (const auto& row : rows) {
        EXPECT_TRUE(row_ids.insert(row.item_id).second);
        if (row.is_selected) {
            ++selected_rows;
            ASSERT_TRUE(row.selected_rank.has_value());
            EXPECT_EQ(r.recommendations[*row.selected_rank - 1].item_id, row.item_id);
        }
    }
    EXPECT_EQ(selected_rows, 10);

    EXPECT_TRUE(runs.taste_profile("u1").has_value());
    EXPECT_FALSE(runs.evidence(r.run_id).empty());

    auto ex = runs.explanations(r.run_id);
    ASSERT_EQ(ex.size(), 10u);
    for (const auto& e : ex) {
        EXPECT_FALSE(e.generated_by_llm);
        EXPECT_FALSE(e.text.empty());
    }
}

TEST_F(PipelineTest, OracleExplanationsAreStoredWhenUsable) {
    llm::MockLLMClient mock;
    mock.set_default(R"({"explanations": [{"index": 1, "explanation": "Because you liked it."}]})");
    recs::RecommendationService svc(lib, index, runs, mock, cfg, fakes::no_sleep_retry(), rep);

    auto r = svc.generate_for_user(user("u1"));
    auto ex = runs.explanations(r.run_id);
    ASSERT_EQ(ex.size(), 10u);
    // first of each batch of five comes from the oracle
    EXPECT_TRUE(ex[0].generated_by_llm);
    EXPECT_EQ(ex[0].text, "Because you liked it.");
    EXPECT_FALSE(ex[1].generated_by_llm);
    EXPECT_TRUE(ex[5].generated_by_llm);
    EXPECT_EQ(mock.calls(), 2u);
}

TEST_F(PipelineTest, VectorStoreFailureMarksRunFailedAndPropagates) {
    fakes::FlakyVectorStore flaky(index);
    flaky.fail_queries = true;
    auto svc = service(lib, flaky);

    EXPECT_THROW(svc.generate_for_user(user("u1")), store::StoreError);

    auto all = runs.runs_for_user("u1");
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].status, store::RunStatus::Failed);
    ASSERT_TRUE(all[0].error_message.has_value());
    EXPECT_EQ(*all[0].error_message, "vector store unreachable");
}

TEST_F(PipelineTest, StopRequestCancelsAndFailsTheRun) {
    auto svc = service(lib, index);
    jobs::StopToken stop;
    stop.request_stop();

    EXPECT_THROW(svc.generate_for_user(user("u1"), stop), jobs::OperationCancelled);
    auto all = runs.runs_for_user("u1");
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].status, store::RunStatus::Failed);
}

TEST_F(PipelineTest, BatchCountsFailedUsersAndMovesOn) {
    lib.add_user(user("u2"));
    lib.add_user(user("u3"));
    for (int i = 10; i < 14; ++i) lib.add_watch("u3", fakes::watched("m" + std::to_string(i), 1));

    store::User disabled = user("u4");
    disabled.enabled = false;
    lib.add_user(disabled);

    FailingHistoryLibrary flaky(lib, "u2");
    auto svc = service(flaky, index);
    auto summary = svc.generate_for_all_users();

    EXPECT_EQ(summary.success, 2);
    EXPECT_EQ(summary.failed, 1);
    ASSERT_EQ(summary.failed_users.size(), 1u);
    EXPECT_EQ(summary.failed_users[0], "u2");
    EXPECT_EQ(summary.total_recommendations, 20u);

    EXPECT_TRUE(rep.completed());
    EXPECT_EQ(rep.summary()["failed"], 1);
    EXPECT_TRUE(runs.runs_for_user("u4").empty());
}

TEST_F(PipelineTest, RegenerateReplacesPreviousRuns) {
    auto svc = service(lib, index);
    svc.generate_for_user(user("u1"));
    svc.generate_for_user(user("u1"));
    ASSERT_EQ(runs.runs_for_user("u1").size(), 2u);

    auto r = svc.regenerate_user("u1");
    auto all = runs.runs_for_user("u1");
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, r.run_id);

    EXPECT_THROW(svc.regenerate_user("nobody"), std::runtime_error);
}

TEST_F(PipelineTest, ClearAndRebuildStartsFromNothing) {
    auto svc = service(lib, index);
    svc.generate_for_user(user("u1"));
    svc.generate_for_user(user("u1"));

    auto out = svc.clear_and_rebuild_all();
    EXPECT_EQ(out.cleared_runs, 2u);
    EXPECT_EQ(out.batch.success, 1);
    EXPECT_EQ(runs.run_count(), 1u);
    EXPECT_EQ(out.to_json()["cleared_runs"], 2);
}

TEST_F(PipelineTest, PublisherErrorsSurfaceOnlyThroughWaitBackground) {
    lib.add_user(user("u3"));
    for (int i = 10; i < 14; ++i) lib.add_watch("u3", fakes::watched("m" + std::to_string(i), 1));

    std::atomic<int> published{0};
    auto svc = service(lib, index);
    svc.set_publisher([&published](const recs::GenerationResult& r) {
        ++published;
        if (r.user_id == "u3") throw std::runtime_error("disk full");
    });

    auto summary = svc.generate_for_all_users();
    EXPECT_EQ(summary.success, 2);

    auto errors = svc.wait_background();
    EXPECT_EQ(published.load(), 2);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("disk full"), std::string::npos);
    EXPECT_TRUE(svc.wait_background().empty());
}

TEST_F(PipelineTest, FinishedPublisherTasksAreReapedAndKeepTheirErrors) {
    lib.add_user(user("u3"));
    for (int i = 10; i < 14; ++i) lib.add_watch("u3", fakes::watched("m" + std::to_string(i), 1));

    std::atomic<int> published{0};
    auto svc = service(lib, index);
    svc.set_publisher([&published](const recs::GenerationResult& r) {
        ++published;
        if (r.user_id == "u3") throw std::runtime_error("disk full");
    });

    for (int round = 0; round < 3; ++round) svc.generate_for_all_users();

    size_t pending = svc.pending_background();
    for (int i = 0; i < 500 && pending > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        pending = svc.pending_background();
    }
    EXPECT_EQ(pending, 0u);
    EXPECT_EQ(published.load(), 6);

    auto errors = svc.wait_background();
    ASSERT_EQ(errors.size(), 3u);
    for (const auto& e : errors) EXPECT_NE(e.find("disk full"), std::string::npos);
    EXPECT_TRUE(svc.wait_background().empty());
}

TEST_F(PipelineTest, EmptyRunsAreNotPublished) {
    lib.add_user(user("fresh"));
    std::atomic<int> published{0};
    auto svc = service(lib, index);
    svc.set_publisher([&published](const recs::GenerationResult&) { ++published; });

    svc.generate_for_user(user("fresh"));
    svc.wait_background();
    EXPECT_EQ(published.load(), 0);
}
