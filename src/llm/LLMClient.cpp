#include "llm/LLMClient.hpp"

#include <thread>

namespace llm {

std::string call_with_retry(LLMClient& client, const std::string& prompt, const RetryPolicy& policy) {
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    auto delay = policy.base_delay;

    for (int attempt = 1;; ++attempt) {
        try {
            return client.classify(prompt);
        } catch (const TransientError&) {
            if (attempt >= attempts) throw;
        }

        if (policy.sleep) {
            policy.sleep(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
        delay = std::chrono::milliseconds((long long)(delay.count() * policy.multiplier));
    }
}

}  // namespace llm
