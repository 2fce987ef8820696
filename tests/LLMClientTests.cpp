#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "llm/LLMClient.hpp"
#include "llm/MockLLMClient.hpp"
#include "llm/ProcUtil.hpp"

#include "Fakes.hpp"

namespace {

// fails `failures` times with TransientError, then answers
class EventuallyOk final : public llm::LLMClient {
public:
    explicit EventuallyOk(int failures) : failures_(failures) {}

    std::string classify(const std::string&) override {
        ++calls;
        if (calls <= failures_) throw llm::TransientError("connection refused");
        return "YES";
    }

    int calls = 0;

private:
    int failures_;
};

}  // namespace

TEST(CallWithRetry, RetriesTransientFailuresWithGrowingDelay) {
    EventuallyOk client(2);
    std::vector<long long> delays;
    llm::RetryPolicy p;
    p.max_attempts = 3;
    p.base_delay = std::chrono::milliseconds(100);
    p.sleep = [&](std::chrono::milliseconds d) { delays.push_back(d.count()); };

    EXPECT_EQ(llm::call_with_retry(client, "prompt", p), "YES");
    EXPECT_EQ(client.calls, 3);
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_EQ(delays[0], 100);
    EXPECT_EQ(delays[1], 200);
}

TEST(CallWithRetry, RethrowsLastTransientErrorWhenAttemptsRunOut) {
    EventuallyOk client(5);
    EXPECT_THROW(llm::call_with_retry(client, "prompt", fakes::no_sleep_retry(2)), llm::TransientError);
    EXPECT_EQ(client.calls, 2);
}

TEST(CallWithRetry, QuotaAndOtherErrorsAreNotRetried) {
    fakes::FailingLLMClient quota(fakes::FailingLLMClient::Kind::Quota);
    EXPECT_THROW(llm::call_with_retry(quota, "p", fakes::no_sleep_retry()), llm::QuotaExceededError);
    EXPECT_EQ(quota.calls, 1);

    fakes::FailingLLMClient other(fakes::FailingLLMClient::Kind::Other);
    EXPECT_THROW(llm::call_with_retry(other, "p", fakes::no_sleep_retry()), std::runtime_error);
    EXPECT_EQ(other.calls, 1);
}

TEST(MockLLMClient, FirstMatchingRuleAnswersCaseInsensitively) {
    llm::MockLLMClient mock;
    mock.set_default("NO - default");
    mock.add_rule({"star wars", "YES - space opera", ""});
    mock.add_rule({"Alien", "", "transient"});

    EXPECT_EQ(mock.classify("Is STAR WARS related?"), "YES - space opera");
    EXPECT_EQ(mock.classify("something else"), "NO - default");
    EXPECT_THROW(mock.classify("alien vs predator"), llm::TransientError);
    EXPECT_EQ(mock.calls(), 3u);
    EXPECT_EQ(mock.prompts().front(), "Is STAR WARS related?");
}

TEST(MockLLMClient, LoadsRulesFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "media_recs_mock_rules.json";
    {
        std::ofstream out(path);
        out << R"({"default": "", "rules": [{"match": "Heat", "answer": "YES"}, {"match": "Cats", "error": "quota"}]})";
    }

    llm::MockLLMClient mock(path.string());
    EXPECT_EQ(mock.classify("about Heat"), "YES");
    EXPECT_EQ(mock.classify("about nothing"), "");
    EXPECT_THROW(mock.classify("Cats (2019)"), llm::QuotaExceededError);

    std::filesystem::remove(path);
    EXPECT_THROW(llm::MockLLMClient(path.string()), std::runtime_error);
}

TEST(ProcUtil, ShellQuoteSurvivesSingleQuotes) {
    EXPECT_EQ(procutil::shell_quote("abc"), "'abc'");
    EXPECT_EQ(procutil::shell_quote("it's"), "'it'\\''s'");
}

TEST(ProcUtil, RunCaptureReportsExitCodeAndMergedOutput) {
    auto ok = procutil::run_capture("echo hello");
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_EQ(ok.output, "hello\n");

    auto err = procutil::run_capture("echo oops 1>&2; exit 3");
    EXPECT_EQ(err.exit_code, 3);
    EXPECT_NE(err.output.find("oops"), std::string::npos);
}

TEST(ProcUtil, RunCaptureMergesStderrOfEveryCommandInTheLine) {
    auto r = procutil::run_capture("echo first 1>&2; echo second; echo third 1>&2");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.output, "first\nsecond\nthird\n");
}
