#include "jobs/StopToken.hpp"

namespace jobs {

void StopToken::throw_if_stopped(const std::string& where) const {
    if (stop_requested()) throw OperationCancelled(where);
}

}  // namespace jobs
