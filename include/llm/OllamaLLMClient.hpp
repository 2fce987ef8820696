#pragma once

#include "llm/LLMClient.hpp"

#include <filesystem>
#include <string>

namespace llm {

struct OllamaOptions {
    std::string model = "llama3.1:8b";
    std::string endpoint = "http://127.0.0.1:11434/api/generate";
    std::string cache_dir = "out/llm_cache";  // "" disables the response cache
    int timeout_seconds = 60;
    double temperature = 0.0;
    int num_predict = 512;
};

class OllamaLLMClient final : public LLMClient {
    OllamaOptions opt_;
    std::filesystem::path cache_dir_;

public:
    explicit OllamaLLMClient(OllamaOptions opt);

    // curl exit codes 6/7/28 and HTTP 429/5xx raise TransientError;
    // quota / billing refusals raise QuotaExceededError.
    std::string classify(const std::string& prompt) override;

private:
    std::string run_ollama(const std::string& prompt) const;

    std::string cache_key(const std::string& prompt) const;
    bool load_cache(const std::string& key, std::string& out) const;
    void save_cache(const std::string& key, const std::string& content) const;
};

}  // namespace llm
