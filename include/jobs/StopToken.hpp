#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace jobs {

// Raised by the cooperative stop check when the surrounding job is being torn down.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& where)
        : std::runtime_error("operation cancelled: " + where) {}
};

// Shared cooperative stop flag. Copies observe the same flag.
class StopToken {
public:
    StopToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void request_stop() { flag_->store(true); }
    bool stop_requested() const { return flag_->load(); }

    // throws OperationCancelled naming `where`
    void throw_if_stopped(const std::string& where) const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace jobs
