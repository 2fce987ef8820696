#include "jobs/ProgressReporter.hpp"

#include <iostream>

namespace jobs {

const char* log_level_str(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        default: return "unknown";
    }
}

ConsoleProgressReporter::ConsoleProgressReporter(std::string job_name, LogLevel min_level)
    : job_(std::move(job_name)), min_level_(min_level) {}

void ConsoleProgressReporter::emit(LogLevel level, const std::string& message) {
    if ((int)level < (int)min_level_) return;
    std::lock_guard<std::mutex> lk(mu_);
    std::cerr << "[" << log_level_str(level) << "] " << job_ << ": " << message << "\n";
}

void ConsoleProgressReporter::set_step(int index, const std::string& name, int total_steps) {
    emit(LogLevel::Info, "step " + std::to_string(index + 1) + "/" + std::to_string(total_steps) + " " + name);
}

void ConsoleProgressReporter::update(size_t current, size_t total, const std::string& message) {
    const int pct = total == 0 ? 100 : (int)((current * 100) / total);
    emit(LogLevel::Debug, std::to_string(current) + "/" + std::to_string(total) + " (" +
                              std::to_string(pct) + "%) " + message);
}

void ConsoleProgressReporter::log(LogLevel level, const std::string& message) {
    emit(level, message);
}

void ConsoleProgressReporter::complete(const nlohmann::json& summary) {
    emit(LogLevel::Info, "done " + summary.dump());
}

void ConsoleProgressReporter::fail(const std::string& message) {
    emit(LogLevel::Error, "failed: " + message);
}

void RecordingProgressReporter::set_step(int, const std::string& name, int) {
    std::lock_guard<std::mutex> lk(mu_);
    steps_.push_back(name);
}

void RecordingProgressReporter::update(size_t, size_t, const std::string&) {}

void RecordingProgressReporter::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lk(mu_);
    lines_.push_back({level, message});
}

void RecordingProgressReporter::complete(const nlohmann::json& summary) {
    std::lock_guard<std::mutex> lk(mu_);
    completed_ = true;
    summary_ = summary;
}

void RecordingProgressReporter::fail(const std::string& message) {
    std::lock_guard<std::mutex> lk(mu_);
    failed_ = true;
    failure_ = message;
}

std::vector<RecordingProgressReporter::Line> RecordingProgressReporter::lines() const {
    std::lock_guard<std::mutex> lk(mu_);
    return lines_;
}

std::vector<std::string> RecordingProgressReporter::steps() const {
    std::lock_guard<std::mutex> lk(mu_);
    return steps_;
}

bool RecordingProgressReporter::completed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return completed_;
}

bool RecordingProgressReporter::failed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failed_;
}

nlohmann::json RecordingProgressReporter::summary() const {
    std::lock_guard<std::mutex> lk(mu_);
    return summary_;
}

std::string RecordingProgressReporter::failure() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failure_;
}

size_t RecordingProgressReporter::count_at_least(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (const auto& l : lines_) {
        if ((int)l.level >= (int)level) ++n;
    }
    return n;
}

}  // namespace jobs
