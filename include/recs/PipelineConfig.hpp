#pragma once

#include <string>

#include "nlohmann/json.hpp"

#include "llm/LLMClient.hpp"
#include "llm/OllamaLLMClient.hpp"
#include "recs/Scorer.hpp"
#include "recs/TasteProfile.hpp"
#include "similarity/GraphOptions.hpp"
#include "store/MediaItem.hpp"

namespace recs {

struct PipelineConfig {
    store::MediaType media_type = store::MediaType::Movie;

    size_t max_candidates = 50000;
    int selected_count = 50;
    size_t recent_watch_limit = 50;
    size_t genre_profile_items = 30;

    ScoreWeights weights;
    TasteConfig taste;

    size_t evidence_per_item = 3;
    size_t stored_candidate_limit = 100;

    bool explanations_enabled = true;
    size_t explanation_batch_size = 10;
};

struct LlmConfig {
    llm::OllamaOptions ollama;
    llm::RetryPolicy retry;
};

struct AppConfig {
    PipelineConfig pipeline;
    similarity::GraphOptions graph;
    LlmConfig llm;
};

// Reads {"pipeline": {...}, "graph": {...}, "llm": {...}} over the defaults.
// Unknown keys are ignored; a present key of the wrong type throws std::runtime_error.
AppConfig load_app_config(const std::string& path);

// Same, from an already-parsed document (path is only used in messages).
AppConfig app_config_from_json(const nlohmann::json& j, const std::string& origin = "<json>");

}  // namespace recs
