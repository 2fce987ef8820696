#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "store/LibraryStore.hpp"

namespace similarity {

// Memoized collection member counts. One instance is shared by every graph build that should
// see the same counts; construct a fresh one to pick up library changes.
class CollectionSizeCache {
public:
    explicit CollectionSizeCache(const store::LibraryStore& library) : library_(library) {}

    size_t size_of(const std::string& collection_name);
    void clear();

private:
    const store::LibraryStore& library_;
    std::mutex mu_;
    std::unordered_map<std::string, size_t> sizes_;
};

}  // namespace similarity
