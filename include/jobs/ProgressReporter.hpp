#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace jobs {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* log_level_str(LogLevel l);

// Sink for step/percentage updates and log lines emitted by long-running operations.
// Implementations must be safe to call from several threads.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void set_step(int index, const std::string& name, int total_steps) = 0;
    virtual void update(size_t current, size_t total, const std::string& message) = 0;
    virtual void log(LogLevel level, const std::string& message) = 0;
    virtual void complete(const nlohmann::json& summary) = 0;
    virtual void fail(const std::string& message) = 0;

    void debug(const std::string& m) { log(LogLevel::Debug, m); }
    void info(const std::string& m) { log(LogLevel::Info, m); }
    void warn(const std::string& m) { log(LogLevel::Warn, m); }
    void error(const std::string& m) { log(LogLevel::Error, m); }
};

class NullProgressReporter final : public ProgressReporter {
public:
    void set_step(int, const std::string&, int) override {}
    void update(size_t, size_t, const std::string&) override {}
    void log(LogLevel, const std::string&) override {}
    void complete(const nlohmann::json&) override {}
    void fail(const std::string&) override {}
};

// "[info] job: message" lines on std::cerr
class ConsoleProgressReporter final : public ProgressReporter {
public:
    explicit ConsoleProgressReporter(std::string job_name, LogLevel min_level = LogLevel::Info);

    void set_step(int index, const std::string& name, int total_steps) override;
    void update(size_t current, size_t total, const std::string& message) override;
    void log(LogLevel level, const std::string& message) override;
    void complete(const nlohmann::json& summary) override;
    void fail(const std::string& message) override;

private:
    std::string job_;
    LogLevel min_level_;
    std::mutex mu_;

    void emit(LogLevel level, const std::string& message);
};

class RecordingProgressReporter final : public ProgressReporter {
public:
    struct Line {
        LogLevel level;
        std::string message;
    };

    void set_step(int index, const std::string& name, int total_steps) override;
    void update(size_t current, size_t total, const std::string& message) override;
    void log(LogLevel level, const std::string& message) override;
    void complete(const nlohmann::json& summary) override;
    void fail(const std::string& message) override;

    std::vector<Line> lines() const;
    std::vector<std::string> steps() const;
    bool completed() const;
    bool failed() const;
    nlohmann::json summary() const;
    std::string failure() const;

    // number of log lines at `level` or above
    size_t count_at_least(LogLevel level) const;

private:
    mutable std::mutex mu_;
    std::vector<Line> lines_;
    std::vector<std::string> steps_;
    bool completed_ = false;
    bool failed_ = false;
    nlohmann::json summary_;
    std::string failure_;
};

}  // namespace jobs
