#pragma once
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

namespace llm {

// Timeouts, refused connections, rate limiting: worth another attempt.
class TransientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The provider refuses further work for this batch; never retried.
class QuotaExceededError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LLMClient {
public:
    virtual ~LLMClient() = default;

    // One prompt in, short free text out. May throw TransientError / QuotaExceededError;
    // an empty string means "no answer".
    virtual std::string classify(const std::string& prompt) = 0;
};

class NullLLMClient final : public LLMClient {
public:
    std::string classify(const std::string&) override { return {}; }
};

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{250};
    double multiplier = 2.0;

    // tests swap this for a no-op
    std::function<void(std::chrono::milliseconds)> sleep;
};

// Calls client.classify(prompt), retrying TransientError with exponential backoff.
// The last TransientError is rethrown once attempts are exhausted; QuotaExceededError and
// any other exception pass straight through.
std::string call_with_retry(LLMClient& client, const std::string& prompt, const RetryPolicy& policy = {});

}  // namespace llm
