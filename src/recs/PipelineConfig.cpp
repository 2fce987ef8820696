#include "recs/PipelineConfig.hpp"

#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace recs {

namespace {

class Section {
public:
    Section(const json& root, const char* name, const std::string& origin) : origin_(origin), name_(name) {
        if (root.contains(name)) {
            if (!root[name].is_object()) fail(name, "an object");
            obj_ = &root[name];
        }
    }

    void read(const char* key, double& out) const {
        const json* v = find(key);
        if (!v) return;
        if (!v->is_number()) fail(key, "a number");
        out = v->get<double>();
    }

    void read(const char* key, int& out) const {
        const json* v = find(key);
        if (!v) return;
        if (!v->is_number_integer()) fail(key, "an integer");
        out = v->get<int>();
    }

    void read(const char* key, size_t& out) const {
        const json* v = find(key);
        if (!v) return;
        if (!v->is_number_unsigned() && !(v->is_number_integer() && v->get<long long>() >= 0)) {
            fail(key, "a non-negative integer");
        }
        out = v->get<size_t>();
    }

    void read(const char* key, bool& out) const {
        const json* v = find(key);
        if (!v) return;
        if (!v->is_boolean()) fail(key, "a boolean");
        out = v->get<bool>();
    }

    void read(const char* key, std::string& out) const {
        const json* v = find(key);
        if (!v) return;
        if (!v->is_string()) fail(key, "a string");
        out = v->get<std::string>();
    }

    void read(const char* key, store::MediaType& out) const {
        std::string s;
        read(key, s);
        if (!s.empty()) out = store::parse_media_type(s);
    }

private:
    const json* obj_ = nullptr;
    std::string origin_;
    std::string name_;

    const json* find(const char* key) const {
        if (!obj_ || !obj_->contains(key)) return nullptr;
        return &(*obj_)[key];
    }

    [[noreturn]] void fail(const char* key, const char* what) const {
        throw std::runtime_error(origin_ + ": " + name_ + "." + key + " must be " + what);
    }
};

}  // namespace

AppConfig app_config_from_json(const json& j, const std::string& origin) {
    if (!j.is_object()) throw std::runtime_error(origin + ": config root must be an object");

    AppConfig cfg;

    Section p(j, "pipeline", origin);
    p.read("media_type", cfg.pipeline.media_type);
    p.read("max_candidates", cfg.pipeline.max_candidates);
    p.read("selected_count", cfg.pipeline.selected_count);
    p.read("recent_watch_limit", cfg.pipeline.recent_watch_limit);
    p.read("genre_profile_items", cfg.pipeline.genre_profile_items);
    p.read("similarity_weight", cfg.pipeline.weights.similarity);
    p.read("novelty_weight", cfg.pipeline.weights.novelty);
    p.read("rating_weight", cfg.pipeline.weights.rating);
    p.read("diversity_weight", cfg.pipeline.weights.diversity);
    p.read("evidence_per_item", cfg.pipeline.evidence_per_item);
    p.read("stored_candidate_limit", cfg.pipeline.stored_candidate_limit);
    p.read("explanations_enabled", cfg.pipeline.explanations_enabled);
    p.read("explanation_batch_size", cfg.pipeline.explanation_batch_size);

    Section g(j, "graph", origin);
    g.read("limit", cfg.graph.limit);
    g.read("depth", cfg.graph.depth);
    g.read("bubble_threshold", cfg.graph.bubble_threshold);
    g.read("ai_default_similarity", cfg.graph.ai_default_similarity);
    g.read("ai_min_suggestions", cfg.graph.ai_min_suggestions);
    g.read("ai_exclude_titles", cfg.graph.ai_exclude_titles);

    Section l(j, "llm", origin);
    l.read("model", cfg.llm.ollama.model);
    l.read("endpoint", cfg.llm.ollama.endpoint);
    l.read("cache_dir", cfg.llm.ollama.cache_dir);
    l.read("timeout_seconds", cfg.llm.ollama.timeout_seconds);
    l.read("max_attempts", cfg.llm.retry.max_attempts);

    int base_delay_ms = (int)cfg.llm.retry.base_delay.count();
    l.read("base_delay_ms", base_delay_ms);
    cfg.llm.retry.base_delay = std::chrono::milliseconds(base_delay_ms);

    if (cfg.pipeline.selected_count < 0) throw std::runtime_error(origin + ": pipeline.selected_count must be >= 0");
    if (cfg.graph.depth < 1 || cfg.graph.depth > 3) throw std::runtime_error(origin + ": graph.depth must be 1..3");
    if (cfg.graph.limit < 1) throw std::runtime_error(origin + ": graph.limit must be >= 1");

    return cfg;
}

AppConfig load_app_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("failed to open config: " + path);

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid JSON in " + path + ": " + e.what());
    }
    return app_config_from_json(j, path);
}

}  // namespace recs
