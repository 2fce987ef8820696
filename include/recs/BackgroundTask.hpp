#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "jobs/ProgressReporter.hpp"

namespace recs {

// Runs `fn` on its own thread. An exception thrown by `fn` is logged as a warning and kept
// for inspection; it never reaches the code that started the task. The destructor joins.
class BackgroundTask {
public:
    BackgroundTask(std::string name, std::function<void()> fn, jobs::ProgressReporter& reporter);
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    void wait();

    const std::string& name() const { return name_; }
    bool finished() const;
    std::optional<std::string> error() const;

private:
    std::string name_;
    jobs::ProgressReporter& reporter_;

    mutable std::mutex mu_;
    bool finished_ = false;
    std::optional<std::string> error_;

    std::thread thread_;
};

}  // namespace recs
