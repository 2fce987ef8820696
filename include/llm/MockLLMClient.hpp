#pragma once

#include "llm/LLMClient.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace llm {

// Scripted answers: the first rule whose `match` occurs in the prompt (case-insensitive)
// supplies the answer. Rule files look like
//   {"default": "", "rules": [{"match": "Star Wars", "answer": "YES"}, ...]}
// A rule may instead carry "error": "transient" | "quota" to simulate failures.
class MockLLMClient final : public LLMClient {
public:
    struct Rule {
        std::string match;
        std::string answer;
        std::string error;  // "", "transient", "quota"
    };

    MockLLMClient() = default;
    explicit MockLLMClient(const std::string& rules_path);

    void add_rule(Rule r);
    void set_default(std::string answer) { default_ = std::move(answer); }

    std::string classify(const std::string& prompt) override;

    size_t calls() const;
    std::vector<std::string> prompts() const;

private:
    std::vector<Rule> rules_;
    std::string default_;

    mutable std::mutex mu_;
    std::vector<std::string> prompts_;
};

}  // namespace llm
