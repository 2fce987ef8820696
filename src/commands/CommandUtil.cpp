#include "commands/Commands.hpp"

#include "llm/MockLLMClient.hpp"
#include "llm/OllamaLLMClient.hpp"

#include <algorithm>
#include <stdexcept>

namespace cli {

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == key) return true;
    }
    return false;
}

static int to_int(const std::string& s, const std::string& flag) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got \"" + s + "\"");
    }
    if (used != s.size()) throw std::invalid_argument(flag + " expects an integer, got \"" + s + "\"");
    return v;
}

recs::AppConfig load_config(int argc, char** argv) {
    const std::string path = get_arg(argc, argv, "--config", "");

    recs::AppConfig cfg;
    if (!path.empty()) {
        cfg = recs::load_app_config(path);
    } else {
        cfg.pipeline.max_candidates = 500;
    }

    const std::string model = get_arg(argc, argv, "--llm_model", "");
    if (!model.empty()) cfg.llm.ollama.model = model;
    if (has_flag(argc, argv, "--llm_cache")) cfg.llm.ollama.cache_dir = get_arg(argc, argv, "--llm_cache", "");

    const std::string maxc = get_arg(argc, argv, "--max_candidates", "");
    if (!maxc.empty()) {
        const int v = to_int(maxc, "--max_candidates");
        if (v < 1) throw std::invalid_argument("--max_candidates must be >= 1");
        cfg.pipeline.max_candidates = (size_t)v;
    }
    const std::string sel = get_arg(argc, argv, "--selected", "");
    if (!sel.empty()) cfg.pipeline.selected_count = std::max(0, to_int(sel, "--selected"));

    const std::string type = get_arg(argc, argv, "--type", "");
    if (!type.empty()) cfg.pipeline.media_type = store::parse_media_type(type);

    if (has_flag(argc, argv, "--no_explanations")) cfg.pipeline.explanations_enabled = false;

    const std::string depth = get_arg(argc, argv, "--depth", "");
    if (!depth.empty()) cfg.graph.depth = to_int(depth, "--depth");
    const std::string limit = get_arg(argc, argv, "--limit", "");
    if (!limit.empty()) cfg.graph.limit = to_int(limit, "--limit");
    if (cfg.graph.depth < 1 || cfg.graph.depth > 3) throw std::invalid_argument("--depth must be 1..3");
    if (cfg.graph.limit < 1) throw std::invalid_argument("--limit must be >= 1");

    return cfg;
}

std::unique_ptr<llm::LLMClient> make_oracle(int argc, char** argv, const recs::LlmConfig& cfg) {
    const std::string mock = get_arg(argc, argv, "--llm_mock", "");
    if (!mock.empty()) return std::make_unique<llm::MockLLMClient>(mock);
    if (has_flag(argc, argv, "--no_llm")) return std::make_unique<llm::NullLLMClient>();
    return std::make_unique<llm::OllamaLLMClient>(cfg.ollama);
}

}  // namespace cli
