#include "emb/LibraryEmbedder.hpp"

#include <algorithm>

#include "util/TextUtil.hpp"

namespace emb {

static std::vector<std::string> head(const std::vector<std::string>& v, size_t n) {
    return std::vector<std::string>(v.begin(), v.begin() + std::min(n, v.size()));
}

std::string item_embedding_text(const store::MediaItem& item) {
    std::vector<std::string> sections;

    sections.push_back(item.year > 0 ? item.title + " (" + std::to_string(item.year) + ")" : item.title);

    if (!item.genres.empty()) sections.push_back("Genres: " + textutil::join(item.genres, ", "));
    if (!item.content_rating.empty()) sections.push_back("Rated " + item.content_rating);
    if (!item.directors.empty()) sections.push_back("Directed by " + textutil::join(item.directors, ", "));
    if (!item.studios.empty()) sections.push_back("Studio: " + textutil::join(head(item.studios, 2), ", "));
    if (item.network) sections.push_back("Network: " + *item.network);

    if (!item.actors.empty()) {
        std::vector<std::string> leads;
        for (size_t i = 0; i < item.actors.size() && i < 3; ++i) leads.push_back(item.actors[i].name);
        sections.push_back("Starring " + textutil::join(leads, ", "));
    }

    if (!item.overview.empty()) {
        sections.push_back(item.overview.size() > 1000 ? textutil::utf8_prefix(item.overview, 1000) + "..." : item.overview);
    }
    if (!item.keywords.empty()) sections.push_back("Themes: " + textutil::join(item.keywords, ", "));

    return textutil::join(sections, ". ");
}

store::EmbeddingIndex embed_library(const std::vector<store::MediaItem>& items,
                                    const TextEmbedder& embedder,
                                    jobs::ProgressReporter& reporter,
                                    EmbedStats* stats,
                                    const jobs::StopToken& stop,
                                    size_t max_len) {
    EmbedStats local;
    std::vector<std::string> ids;
    std::vector<float> vecs;
    size_t dim = 0;

    for (size_t i = 0; i < items.size(); ++i) {
        stop.throw_if_stopped("embedding library");
        const auto& item = items[i];

        std::vector<float> v;
        try {
            v = embedder.embed(item_embedding_text(item), max_len);
        } catch (const std::exception& e) {
            reporter.warn("embedding failed for " + item.id + ": " + e.what());
        }

        if (v.empty() || (dim != 0 && v.size() != dim)) {
            ++local.skipped;
            reporter.debug("skipped " + item.id);
            continue;
        }
        if (dim == 0) dim = v.size();

        ids.push_back(item.id);
        vecs.insert(vecs.end(), v.begin(), v.end());
        ++local.embedded;

        if ((i + 1) % 100 == 0 || i + 1 == items.size()) {
            reporter.update(i + 1, items.size(), "embedded " + std::to_string(local.embedded));
        }
    }

    store::EmbeddingIndex idx;
    if (!ids.empty()) idx.set(std::move(ids), std::move(vecs), dim);

    if (stats) *stats = local;
    return idx;
}

}  // namespace emb
