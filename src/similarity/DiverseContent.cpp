#include "similarity/DiverseContent.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

#include "util/TextUtil.hpp"

namespace similarity {

std::string build_diverse_prompt(const SimilarityItem& center,
                                 const std::vector<SimilarityItem>& existing,
                                 size_t limit,
                                 size_t max_exclude_titles) {
    const std::string type = store::media_type_str(center.type);
    const std::string plural = center.type == store::MediaType::Series ? type : type + "s";

    std::vector<std::string> titles;
    std::vector<std::string> collections;
    std::unordered_set<std::string> seen_collections;
    for (const auto& it : existing) {
        if (titles.size() < max_exclude_titles) titles.push_back(it.title);
        if (it.collection_name && seen_collections.insert(*it.collection_name).second) {
            collections.push_back(*it.collection_name);
        }
    }

    std::vector<std::string> keywords(center.keywords.begin(),
                                      center.keywords.begin() + std::min<size_t>(5, center.keywords.size()));

    std::string p;
    p += "Given the " + type + " \"" + center.title + "\" (" +
         (center.year > 0 ? std::to_string(center.year) : std::string("unknown year")) +
         "), which has these characteristics:\n";
    p += "- Genres: " + (center.genres.empty() ? std::string("unknown") : textutil::join(center.genres, ", ")) + "\n";
    p += "- Keywords: " + (keywords.empty() ? std::string("unknown") : textutil::join(keywords, ", ")) + "\n";
    if (center.collection_name) p += "- Part of: " + *center.collection_name + "\n";
    p += "\nSuggest " + std::to_string(limit) + " thematically similar " + plural +
         " that would appeal to fans but are from DIFFERENT franchises/collections.\n";
    p += "Look for titles with similar themes, tone, or appeal.\n\n";
    p += "EXCLUDE these titles and their franchises:\n" + textutil::join(titles, ", ") + "\n";
    if (!collections.empty()) {
        p += "\nALSO EXCLUDE anything from: " + textutil::join(collections, ", ") + "\n";
    }
    p += "\nReturn ONLY the " + type + " titles, one per line, without numbers or explanations.\n";
    p += "Focus on well-known, popular titles that are likely to be in a home media library.";
    return p;
}

std::vector<std::string> parse_suggested_titles(const std::string& response) {
    static const std::regex numbering("^\\d+[.)]\\s*");
    static const std::regex bullet("^[-*]\\s*");

    std::vector<std::string> out;
    for (const auto& raw : textutil::split_lines(response)) {
        std::string line = textutil::trim_copy(raw);
        if (line.empty()) continue;

        line = std::regex_replace(line, numbering, "", std::regex_constants::format_first_only);
        line = std::regex_replace(line, bullet, "", std::regex_constants::format_first_only);
        // "•" is three bytes in UTF-8
        if (line.compare(0, 3, "\xE2\x80\xA2") == 0) line.erase(0, 3);
        line = textutil::trim_copy(line);

        if (line.size() > 1 && line.size() < 100) out.push_back(line);
    }
    return out;
}

std::optional<store::MediaItem> match_title_to_library(const std::string& title,
                                                        const std::vector<store::MediaItem>& library_items) {
    const std::string wanted = textutil::to_lower_copy(title);

    for (const auto& it : library_items) {
        if (textutil::to_lower_copy(it.title) == wanted) return it;
    }

    const store::MediaItem* best = nullptr;
    double best_sim = -1.0;
    for (const auto& it : library_items) {
        const std::string lower = textutil::to_lower_copy(it.title);
        const double sim = textutil::trigram_similarity(lower, wanted);
        const bool contains = lower.find(wanted) != std::string::npos;
        if (!contains && sim <= 0.5) continue;
        if (sim > best_sim) {
            best_sim = sim;
            best = &it;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

DiverseContentFinder::DiverseContentFinder(const store::LibraryStore& library,
                                           llm::LLMClient* oracle,
                                           llm::RetryPolicy retry,
                                           jobs::ProgressReporter& reporter,
                                           size_t max_exclude_titles)
    : library_(library),
      oracle_(oracle),
      retry_(std::move(retry)),
      reporter_(reporter),
      max_exclude_titles_(max_exclude_titles) {}

DiverseResult DiverseContentFinder::find(const SimilarityItem& center,
                                         const std::vector<SimilarityItem>& existing,
                                         size_t limit) {
    DiverseResult result;
    if (!oracle_) return result;

    reporter_.info("finding diverse content for \"" + center.title + "\" (" + std::to_string(existing.size()) +
                   " items to exclude)");

    std::string answer;
    try {
        answer = llm::call_with_retry(*oracle_, build_diverse_prompt(center, existing, limit, max_exclude_titles_),
                                      retry_);
    } catch (const std::exception& e) {
        reporter_.error(std::string("diverse content suggestion failed: ") + e.what());
        return result;
    }

    const std::vector<std::string> titles = parse_suggested_titles(answer);
    const std::vector<store::MediaItem> pool = library_.items_of_type(center.type);

    std::unordered_set<std::string> taken;
    for (const auto& t : titles) {
        auto match = match_title_to_library(t, pool);
        if (!match || !taken.insert(match->id).second) continue;
        result.items.push_back(to_similarity_item(*match));
    }

    result.ai_suggested = true;
    reporter_.info("oracle suggested " + std::to_string(titles.size()) + " titles, " +
                   std::to_string(result.items.size()) + " in library");
    return result;
}

}  // namespace similarity
