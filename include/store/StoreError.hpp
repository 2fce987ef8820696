#pragma once

#include <stdexcept>
#include <string>

namespace store {

// A backing store (vectors, library, run tables) could not be read or written.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace store
