#include "recs/Explanations.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "nlohmann/json.hpp"
#include "util/TextUtil.hpp"

using json = nlohmann::json;

namespace recs {

static std::string pct(double x) {
    return std::to_string((int)std::lround(x * 100.0)) + "%";
}

static std::string year_str(int y) {
    return y > 0 ? std::to_string(y) : "N/A";
}

static std::string first_genre(const ScoredCandidate& c) {
    if (c.genres.empty()) return c.type == store::MediaType::Series ? "series" : "film";
    return c.genres.front();
}

std::string fallback_explanation(const ExplanationInput& in) {
    const ScoredCandidate& c = in.candidate;

    if (!in.evidence.empty()) {
        return "Based on your enjoyment of \"" + in.evidence.front().title + "\", this " + first_genre(c) +
               " shares similar qualities you'll likely appreciate.";
    }

    std::vector<std::string> reasons;
    if (c.score.similarity > 0.7) {
        reasons.push_back("strongly matches your viewing history");
    } else if (c.score.similarity > 0.5) {
        reasons.push_back("aligns with your taste");
    }
    if (c.score.novelty > 0.5) reasons.push_back("introduces some fresh genres you might enjoy exploring");
    if (c.score.rating > 0.7) reasons.push_back("is highly acclaimed");

    if (reasons.empty()) {
        return "This " + first_genre(c) + " offers something different from your usual picks.";
    }
    return "This " + first_genre(c) + " " + textutil::join(reasons, " and ") + ".";
}

static const char* evidence_label(store::EvidenceType t) {
    switch (t) {
        case store::EvidenceType::Favorite: return "favorite";
        case store::EvidenceType::Rewatched: return "highly rewatched";
        default: return "watched";
    }
}

std::string build_explanation_prompt(const std::vector<ExplanationInput>& batch, const TasteContext& taste) {
    std::ostringstream p;
    p <<
R"(You are an expert film curator writing personalized recommendation explanations.
For each recommendation write 2-3 warm, conversational sentences that reference the
specific watched titles it is most similar to. Do not spoil plots.
Return ONLY valid JSON. No markdown. No commentary.

Output schema:
{"explanations":[{"index":1,"explanation":"..."}]}

=== USER TASTE ===
)";
    p << "Top genres: " << textutil::join(taste.top_genres, ", ") << "\n";
    if (!taste.favorite_titles.empty()) {
        p << "Most watched/favorite titles:\n";
        for (const auto& t : taste.favorite_titles) p << "- " << t << "\n";
    }

    p << "\n=== RECOMMENDATIONS ===\n";
    for (size_t i = 0; i < batch.size(); ++i) {
        const auto& in = batch[i];
        const auto& c = in.candidate;

        std::string ev;
        for (const auto& e : in.evidence) {
            if (!ev.empty()) ev += ", ";
            ev += "\"" + e.title + "\" (" + pct(e.similarity) + " match, " + evidence_label(e.type) + ")";
        }
        if (ev.empty()) ev = "No direct match data";

        std::string overview = in.overview.empty() ? "No overview available" : in.overview;
        if (overview.size() > 250) overview = textutil::utf8_prefix(overview, 250) + "...";

        p << (i + 1) << ". \"" << c.title << "\" (" << year_str(c.year) << ")\n"
          << "   Genres: " << textutil::join(c.genres, ", ") << "\n"
          << "   Overall match: " << pct(c.score.similarity)
          << " | Novelty: " << (c.score.novelty > 0.5 ? "expands taste" : "familiar")
          << " | Rating: "
          << (c.score.rating > 0.7 ? "highly acclaimed" : c.score.rating > 0.5 ? "well received" : "mixed") << "\n"
          << "   Similar to: " << ev << "\n"
          << "   Plot: " << overview << "\n\n";
    }
    return p.str();
}

std::map<int, std::string> parse_explanations(const std::string& response) {
    std::map<int, std::string> out;

    // models like to wrap JSON in prose; keep the outermost object/array
    const auto a = response.find_first_of("[{");
    const auto b = response.find_last_of("]}");
    if (a == std::string::npos || b == std::string::npos || b <= a) return out;

    json j;
    try {
        j = json::parse(response.substr(a, b - a + 1));
    } catch (const json::exception&) {
        return out;
    }

    const json* arr = nullptr;
    if (j.is_array()) {
        arr = &j;
    } else if (j.is_object() && j.contains("explanations") && j["explanations"].is_array()) {
        arr = &j["explanations"];
    }
    if (!arr) return out;

    for (const auto& e : *arr) {
        if (!e.is_object()) continue;
        if (!e.contains("index") || !e["index"].is_number_integer()) continue;
        if (!e.contains("explanation") || !e["explanation"].is_string()) continue;

        const std::string text = textutil::trim_copy(e["explanation"].get<std::string>());
        if (!text.empty()) out[e["index"].get<int>()] = text;
    }
    return out;
}

ExplanationWriter::ExplanationWriter(llm::LLMClient& client, llm::RetryPolicy retry, size_t batch_size)
    : client_(client), retry_(std::move(retry)), batch_size_(batch_size == 0 ? 10 : batch_size) {}

std::vector<store::Explanation> ExplanationWriter::explain(const std::vector<ExplanationInput>& inputs,
                                                           const TasteContext& taste,
                                                           jobs::ProgressReporter& reporter) {
    std::vector<store::Explanation> out;
    out.reserve(inputs.size());

    bool oracle_available = true;
    for (size_t start = 0; start < inputs.size(); start += batch_size_) {
        const size_t end = std::min(inputs.size(), start + batch_size_);
        std::vector<ExplanationInput> batch(inputs.begin() + start, inputs.begin() + end);

        std::map<int, std::string> parsed;
        if (oracle_available) {
            try {
                parsed = parse_explanations(llm::call_with_retry(client_, build_explanation_prompt(batch, taste), retry_));
                if (parsed.empty()) reporter.warn("explanation response unusable, using fallback text");
            } catch (const llm::QuotaExceededError& e) {
                reporter.warn(std::string("explanations stopped: ") + e.what());
                oracle_available = false;
            } catch (const std::exception& e) {
                reporter.warn(std::string("explanation batch failed: ") + e.what());
            }
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            store::Explanation ex;
            ex.item_id = batch[i].candidate.item_id;
            auto it = parsed.find((int)i + 1);
            if (it != parsed.end()) {
                ex.text = it->second;
                ex.generated_by_llm = true;
            } else {
                ex.text = fallback_explanation(batch[i]);
            }
            out.push_back(std::move(ex));
        }
    }
    return out;
}

}  // namespace recs
