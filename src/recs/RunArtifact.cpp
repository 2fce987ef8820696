#include "recs/RunArtifact.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace recs {

RunArtifact RunArtifact::load(const store::RecommendationStore& runs, const std::string& run_id) {
    auto run = runs.get_run(run_id);
    if (!run) throw std::runtime_error("unknown run: " + run_id);

    RunArtifact a;
    a.run = *run;
    a.candidates = runs.candidates(run_id);
    a.evidence = runs.evidence(run_id);
    a.explanations = runs.explanations(run_id);
    return a;
}

static void add_item_fields(nlohmann::json& j, const std::string& id, const store::LibraryStore* library) {
    if (!library) return;
    auto item = library->get_item(id);
    if (!item) return;
    j["title"] = item->title;
    j["year"] = item->year;
    j["genres"] = item->genres;
}

static nlohmann::json scores_json(const store::CandidateRecord& c) {
    return {
        {"final", c.final_score},
        {"similarity", c.similarity},
        {"novelty", c.novelty},
        {"rating", c.rating_score},
        {"diversity", c.diversity},
    };
}

nlohmann::json RunArtifact::to_json(const store::LibraryStore* library) const {
    nlohmann::json j;

    j["run"] = {
        {"id", run.id},
        {"user_id", run.user_id},
        {"started_at_ms", run.started_at_ms},
        {"status", store::run_status_str(run.status)},
        {"candidate_count", run.candidate_count},
        {"selected_count", run.selected_count},
        {"duration_ms", run.duration_ms},
    };
    if (run.error_message) j["run"]["error_message"] = *run.error_message;

    std::vector<store::CandidateRecord> picked;
    for (const auto& c : candidates) {
        if (c.is_selected) picked.push_back(c);
    }
    std::sort(picked.begin(), picked.end(), [](const store::CandidateRecord& a, const store::CandidateRecord& b) {
        return a.selected_rank.value_or(0) < b.selected_rank.value_or(0);
    });

    nlohmann::json recs = nlohmann::json::array();
    for (const auto& c : picked) {
        nlohmann::json r;
        r["rank"] = c.selected_rank.value_or(0);
        r["item_id"] = c.item_id;
        add_item_fields(r, c.item_id, library);
        r["scores"] = scores_json(c);

        nlohmann::json ev = nlohmann::json::array();
        for (const auto& e : evidence) {
            if (e.candidate_item_id != c.item_id) continue;
            nlohmann::json x = {
                {"watched_item_id", e.watched_item_id},
                {"similarity", e.similarity},
                {"type", store::evidence_type_str(e.type)},
            };
            add_item_fields(x, e.watched_item_id, library);
            ev.push_back(x);
        }
        r["evidence"] = ev;

        for (const auto& x : explanations) {
            if (x.item_id != c.item_id) continue;
            r["explanation"] = x.text;
            r["explanation_source"] = x.generated_by_llm ? "llm" : "template";
        }
        recs.push_back(r);
    }
    j["recommendations"] = recs;

    nlohmann::json pool = nlohmann::json::array();
    for (const auto& c : candidates) {
        nlohmann::json r = {
            {"item_id", c.item_id},
            {"pool_rank", c.pool_rank},
            {"selected", c.is_selected},
            {"scores", scores_json(c)},
        };
        if (c.selected_rank) r["selected_rank"] = *c.selected_rank;
        pool.push_back(r);
    }
    j["candidates"] = pool;

    return j;
}

void RunArtifact::write_to(const std::filesystem::path& out_path, const store::LibraryStore* library) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json(library).dump(2) << "\n";
}

}  // namespace recs
