#include "similarity/ConnectionValidator.hpp"

#include <chrono>
#include <regex>
#include <unordered_set>

#include "util/TextUtil.hpp"

namespace similarity {

namespace {

const std::vector<std::regex>& title_patterns() {
    static const std::vector<std::regex> patterns = [] {
        const auto icase = std::regex::ECMAScript | std::regex::icase;
        return std::vector<std::regex>{
            std::regex("^return of ", icase),
            std::regex("^the return of ", icase),
            std::regex(" returns?$", icase),
            std::regex("^revenge of ", icase),
            std::regex("^rise of ", icase),
            std::regex("^attack of ", icase),
            std::regex("^battle of ", icase),
            std::regex("^escape from ", icase),
            std::regex("^journey to ", icase),
            std::regex(" ii$", icase),
            std::regex(" iii$", icase),
            std::regex(" 2$"),
            std::regex(" 3$"),
        };
    }();
    return patterns;
}

const std::vector<std::vector<std::string>>& franchise_groups() {
    static const std::vector<std::vector<std::string>> groups = {
        {"star wars", "lego star wars", "ewok"},
        {"star trek"},
        {"marvel", "avengers", "iron man", "captain america", "thor", "spider-man", "x-men"},
        {"dc", "batman", "superman", "justice league", "wonder woman"},
        {"lord of the rings", "hobbit", "middle-earth"},
        {"harry potter", "fantastic beasts", "wizarding world"},
        {"disney princess", "frozen", "tangled", "moana"},
        {"pixar", "toy story", "cars", "finding nemo", "incredibles"},
    };
    return groups;
}

std::string strip_collection_suffix(const std::string& lower) {
    static const std::regex suffix("\\s*collection$");
    return textutil::trim_copy(std::regex_replace(lower, suffix, ""));
}

std::string year_or_unknown(int y) {
    return y > 0 ? std::to_string(y) : "unknown";
}

std::string or_unknown(const std::vector<std::string>& v) {
    return v.empty() ? "unknown" : textutil::join(v, ", ");
}

std::int64_t now_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace

std::optional<std::string> detect_title_pattern_match(const std::string& title1, const std::string& title2) {
    for (const auto& pattern : title_patterns()) {
        std::smatch m1, m2;
        if (!std::regex_search(title1, m1, pattern) || !std::regex_search(title2, m2, pattern)) continue;

        const std::string core1 = textutil::to_lower_copy(textutil::trim_copy(std::regex_replace(title1, pattern, "")));
        const std::string core2 = textutil::to_lower_copy(textutil::trim_copy(std::regex_replace(title2, pattern, "")));

        if (core1 != core2 && core1.find(core2) == std::string::npos && core2.find(core1) == std::string::npos) {
            return "Similar title pattern \"" + m1.str() + "\" but unrelated content";
        }
    }
    return std::nullopt;
}

std::vector<std::string> shared_genres(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::unordered_set<std::string> as;
    for (const auto& g : a) as.insert(textutil::to_lower_copy(g));

    std::vector<std::string> out;
    for (const auto& g : b) {
        if (as.count(textutil::to_lower_copy(g))) out.push_back(g);
    }
    return out;
}

bool collections_related(const std::string& c1, const std::string& c2) {
    const std::string l1 = textutil::to_lower_copy(c1);
    const std::string l2 = textutil::to_lower_copy(c2);
    if (l1 == l2) return true;

    const std::string f1 = strip_collection_suffix(l1);
    const std::string f2 = strip_collection_suffix(l2);
    if (f1 == f2) return true;
    if (f1.find(f2) != std::string::npos || f2.find(f1) != std::string::npos) return true;

    for (const auto& group : franchise_groups()) {
        bool in1 = false, in2 = false;
        for (const auto& name : group) {
            if (f1.find(name) != std::string::npos) in1 = true;
            if (f2.find(name) != std::string::npos) in2 = true;
        }
        if (in1 && in2) return true;
    }
    return false;
}

std::string build_validation_prompt(const SimilarityItem& source, const SimilarityItem& target) {
    const std::string kind = source.type == store::MediaType::Series ? "series" : "movies";
    const std::string one = source.type == store::MediaType::Series ? "Series" : "Movie";

    std::string p;
    p += "Are these two " + kind + " thematically related enough to recommend together?\n\n";
    p += one + " 1: \"" + source.title + "\" (" + year_or_unknown(source.year) + ")\n";
    p += "- Genres: " + or_unknown(source.genres) + "\n";
    p += "- Collection: " + source.collection_name.value_or("none") + "\n\n";
    p += one + " 2: \"" + target.title + "\" (" + year_or_unknown(target.year) + ")\n";
    p += "- Genres: " + or_unknown(target.genres) + "\n";
    p += "- Collection: " + target.collection_name.value_or("none") + "\n\n";
    p += "Answer with ONLY \"YES\" or \"NO\" followed by a brief reason (max 10 words).\n";
    p += "Example: \"YES - both epic space adventures\" or \"NO - completely different genres and themes\"";
    return p;
}

OracleVerdict parse_oracle_verdict(const std::string& response) {
    static const std::regex prefix("^(YES|NO)\\s*[-:.]?\\s*", std::regex::icase);

    OracleVerdict v;
    const std::string text = textutil::trim_copy(response);
    const std::string head = textutil::to_lower_copy(text.substr(0, 3));
    v.is_valid = head == "yes";

    v.reason = textutil::trim_copy(std::regex_replace(text, prefix, "", std::regex_constants::format_first_only));
    // leftover dash, ASCII or multi-byte
    while (!v.reason.empty() && ((unsigned char)v.reason[0] >= 0x80 || v.reason[0] == '-')) {
        v.reason.erase(0, 1);
    }
    v.reason = textutil::trim_copy(v.reason);

    if (v.reason.empty()) v.reason = v.is_valid ? "AI approved" : "AI rejected";
    return v;
}

ConnectionValidator::ConnectionValidator(ValidationCache& cache,
                                         llm::LLMClient* oracle,
                                         llm::RetryPolicy retry,
                                         jobs::ProgressReporter& reporter)
    : cache_(cache), oracle_(oracle), retry_(std::move(retry)), reporter_(reporter) {}

ConnectionValidation ConnectionValidator::validate(const SimilarityItem& source, const SimilarityItem& target) {
    if (auto issue = detect_title_pattern_match(source.title, target.title)) {
        reporter_.debug("rejected " + source.title + " -> " + target.title + ": " + *issue);
        return {false, *issue, false};
    }

    if (shared_genres(source.genres, target.genres).empty()) {
        reporter_.debug("rejected " + source.title + " -> " + target.title + ": no shared genres");
        return {false, "No shared genres", false};
    }

    if (!source.collection_name || !target.collection_name ||
        collections_related(*source.collection_name, *target.collection_name)) {
        return {true, "Passed all filters", false};
    }

    if (auto cached = cache_.lookup(source.id, target.id)) {
        return {cached->is_valid, cached->reason.empty() ? "Cached result" : cached->reason, true};
    }

    if (!oracle_ || oracle_exhausted_.load()) {
        return {false, "Unrelated collection chain", false};
    }

    std::string answer;
    try {
        ++oracle_calls_;
        answer = llm::call_with_retry(*oracle_, build_validation_prompt(source, target), retry_);
    } catch (const llm::QuotaExceededError& e) {
        oracle_exhausted_.store(true);
        reporter_.warn(std::string("validation oracle quota exceeded: ") + e.what());
        return {false, "AI validation error", false};
    } catch (const std::exception& e) {
        reporter_.warn(std::string("validation oracle failed, rejecting: ") + e.what());
        return {false, "AI validation error", false};
    }

    const OracleVerdict verdict = parse_oracle_verdict(answer);

    ValidationCacheEntry entry;
    entry.key = PairKey{source.id, target.id};
    entry.source_type = source.type;
    entry.target_type = target.type;
    entry.is_valid = verdict.is_valid;
    entry.reason = verdict.reason;
    entry.created_at = now_seconds();
    try {
        cache_.upsert(entry);
    } catch (const std::exception& e) {
        reporter_.error(std::string("failed to cache validation: ") + e.what());
    }

    reporter_.info("oracle " + std::string(verdict.is_valid ? "accepted " : "rejected ") + source.title + " -> " +
                   target.title + ": " + verdict.reason);
    return {verdict.is_valid, verdict.reason, false};
}

}  // namespace similarity
