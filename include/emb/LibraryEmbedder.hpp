#pragma once
#include <string>
#include <vector>

#include "emb/TextEmbedder.hpp"
#include "jobs/ProgressReporter.hpp"
#include "jobs/StopToken.hpp"
#include "store/EmbeddingIndex.hpp"
#include "store/MediaItem.hpp"

namespace emb {

// "Title (year). Genres: .... Rated PG-13. Directed by .... Studio: .... Starring .... <overview>.
// Themes: ..." with absent sections left out.
std::string item_embedding_text(const store::MediaItem& item);

struct EmbedStats {
    size_t embedded = 0;
    size_t skipped = 0;  // empty vector or dimension mismatch
};

// One vector per item. Items the embedder cannot handle are skipped and logged.
store::EmbeddingIndex embed_library(const std::vector<store::MediaItem>& items,
                                    const TextEmbedder& embedder,
                                    jobs::ProgressReporter& reporter,
                                    EmbedStats* stats = nullptr,
                                    const jobs::StopToken& stop = {},
                                    size_t max_len = 256);

}  // namespace emb
