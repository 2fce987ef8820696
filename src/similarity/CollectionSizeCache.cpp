#include "similarity/CollectionSizeCache.hpp"

namespace similarity {

size_t CollectionSizeCache::size_of(const std::string& collection_name) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = sizes_.find(collection_name);
        if (it != sizes_.end()) return it->second;
    }

    const size_t n = library_.collection_size(collection_name);

    std::lock_guard<std::mutex> lock(mu_);
    sizes_[collection_name] = n;
    return n;
}

void CollectionSizeCache::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    sizes_.clear();
}

}  // namespace similarity
