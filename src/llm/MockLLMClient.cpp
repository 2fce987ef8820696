#include "llm/MockLLMClient.hpp"
#include "nlohmann/json.hpp"
#include "util/TextUtil.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace llm {

MockLLMClient::MockLLMClient(const std::string& rules_path) {
    std::ifstream f(rules_path);
    if (!f) throw std::runtime_error("failed to open mock llm rules: " + rules_path);

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid mock llm rules " + rules_path + ": " + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("mock llm rules must be a JSON object: " + rules_path);

    if (j.contains("default") && j["default"].is_string()) default_ = j["default"].get<std::string>();

    if (j.contains("rules") && j["rules"].is_array()) {
        for (const auto& r : j["rules"]) {
            if (!r.is_object()) continue;
            Rule rule;
            if (r.contains("match") && r["match"].is_string()) rule.match = r["match"].get<std::string>();
            if (r.contains("answer") && r["answer"].is_string()) rule.answer = r["answer"].get<std::string>();
            if (r.contains("error") && r["error"].is_string()) rule.error = r["error"].get<std::string>();
            if (!rule.match.empty()) rules_.push_back(std::move(rule));
        }
    }
}

void MockLLMClient::add_rule(Rule r) {
    rules_.push_back(std::move(r));
}

std::string MockLLMClient::classify(const std::string& prompt) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        prompts_.push_back(prompt);
    }

    for (const auto& r : rules_) {
        if (!textutil::contains_ci(prompt, r.match)) continue;
        if (r.error == "transient") throw TransientError("mock transient failure");
        if (r.error == "quota") throw QuotaExceededError("mock quota exceeded");
        return r.answer;
    }
    return default_;
}

size_t MockLLMClient::calls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return prompts_.size();
}

std::vector<std::string> MockLLMClient::prompts() const {
    std::lock_guard<std::mutex> lk(mu_);
    return prompts_;
}

}  // namespace llm
