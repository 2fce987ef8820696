#include "recs/BackgroundTask.hpp"

#include <exception>

namespace recs {

BackgroundTask::BackgroundTask(std::string name, std::function<void()> fn, jobs::ProgressReporter& reporter)
    : name_(std::move(name)), reporter_(reporter) {
    thread_ = std::thread([this, fn = std::move(fn)]() {
        std::optional<std::string> err;
        try {
            fn();
        } catch (const std::exception& e) {
            err = e.what();
        }

        if (err) reporter_.warn("background task '" + name_ + "' failed: " + *err);

        std::lock_guard<std::mutex> lk(mu_);
        error_ = std::move(err);
        finished_ = true;
    });
}

BackgroundTask::~BackgroundTask() {
    wait();
}

void BackgroundTask::wait() {
    if (thread_.joinable()) thread_.join();
}

bool BackgroundTask::finished() const {
    std::lock_guard<std::mutex> lk(mu_);
    return finished_;
}

std::optional<std::string> BackgroundTask::error() const {
    std::lock_guard<std::mutex> lk(mu_);
    return error_;
}

}  // namespace recs
