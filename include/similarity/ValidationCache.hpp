#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "store/MediaItem.hpp"

namespace similarity {

// Unordered item-id pair: make_pair_key(a, b) == make_pair_key(b, a).
struct PairKey {
    std::string first;   // lexicographically smaller id
    std::string second;

    bool operator==(const PairKey& o) const { return first == o.first && second == o.second; }
    std::string str() const { return first + "|" + second; }
};

PairKey make_pair_key(const std::string& a, const std::string& b);

struct PairKeyHash {
    size_t operator()(const PairKey& k) const;
};

struct ValidationCacheEntry {
    PairKey key;
    store::MediaType source_type = store::MediaType::Movie;
    store::MediaType target_type = store::MediaType::Movie;
    bool is_valid = false;
    std::string reason;
    std::int64_t created_at = 0;  // unix seconds
};

struct ValidationCacheStats {
    size_t total = 0;
    size_t valid = 0;
    size_t invalid = 0;
};

// Verdicts for item pairs whose connection needed the oracle. Writes are idempotent upserts
// (last write wins); implementations are safe to share between threads.
class ValidationCache {
public:
    virtual ~ValidationCache() = default;

    virtual std::optional<ValidationCacheEntry> lookup(const std::string& a, const std::string& b) const = 0;
    virtual void upsert(const ValidationCacheEntry& entry) = 0;
    virtual ValidationCacheStats stats() const = 0;
};

class InMemoryValidationCache : public ValidationCache {
public:
    std::optional<ValidationCacheEntry> lookup(const std::string& a, const std::string& b) const override;
    void upsert(const ValidationCacheEntry& entry) override;
    ValidationCacheStats stats() const override;

protected:
    mutable std::mutex mu_;
    std::unordered_map<PairKey, ValidationCacheEntry, PairKeyHash> entries_;
};

// In-memory cache persisted as a JSON array; loaded on construction, rewritten on every upsert.
class JsonFileValidationCache final : public InMemoryValidationCache {
public:
    explicit JsonFileValidationCache(std::string path);

    void upsert(const ValidationCacheEntry& entry) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;

    void load();
    void save_locked() const;
};

}  // namespace similarity
