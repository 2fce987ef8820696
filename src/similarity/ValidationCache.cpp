#include "similarity/ValidationCache.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <utility>

#include "nlohmann/json.hpp"
#include "store/StoreError.hpp"

using json = nlohmann::json;

namespace similarity {

namespace {

// Orders the key and keeps each type attached to its id.
ValidationCacheEntry canonical(ValidationCacheEntry e) {
    const PairKey key = make_pair_key(e.key.first, e.key.second);
    if (key.first != e.key.first) std::swap(e.source_type, e.target_type);
    e.key = key;
    return e;
}

}  // namespace

PairKey make_pair_key(const std::string& a, const std::string& b) {
    if (b < a) return PairKey{b, a};
    return PairKey{a, b};
}

size_t PairKeyHash::operator()(const PairKey& k) const {
    const size_t h1 = std::hash<std::string>{}(k.first);
    const size_t h2 = std::hash<std::string>{}(k.second);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ull + (h1 << 6) + (h1 >> 2));
}

std::optional<ValidationCacheEntry> InMemoryValidationCache::lookup(const std::string& a, const std::string& b) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(make_pair_key(a, b));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void InMemoryValidationCache::upsert(const ValidationCacheEntry& entry) {
    ValidationCacheEntry e = canonical(entry);

    std::lock_guard<std::mutex> lk(mu_);
    entries_[e.key] = std::move(e);
}

ValidationCacheStats InMemoryValidationCache::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    ValidationCacheStats s;
    s.total = entries_.size();
    for (const auto& kv : entries_) {
        if (kv.second.is_valid) s.valid++;
        else s.invalid++;
    }
    return s;
}

JsonFileValidationCache::JsonFileValidationCache(std::string path) : path_(std::move(path)) {
    load();
}

void JsonFileValidationCache::load() {
    if (!std::filesystem::exists(path_)) return;

    std::ifstream f(path_);
    if (!f) throw store::StoreError("failed to open validation cache: " + path_);

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw store::StoreError("corrupt validation cache " + path_ + ": " + e.what());
    }
    if (!j.is_array()) throw store::StoreError("validation cache must be a JSON array: " + path_);

    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& r : j) {
        if (!r.is_object()) continue;
        if (!r.contains("source_id") || !r["source_id"].is_string()) continue;
        if (!r.contains("target_id") || !r["target_id"].is_string()) continue;
        if (!r.contains("is_valid") || !r["is_valid"].is_boolean()) continue;

        ValidationCacheEntry e;
        e.key = PairKey{r["source_id"].get<std::string>(), r["target_id"].get<std::string>()};
        e.is_valid = r["is_valid"].get<bool>();
        if (r.contains("reason") && r["reason"].is_string()) e.reason = r["reason"].get<std::string>();
        if (r.contains("source_type") && r["source_type"].is_string())
            e.source_type = store::parse_media_type(r["source_type"].get<std::string>());
        if (r.contains("target_type") && r["target_type"].is_string())
            e.target_type = store::parse_media_type(r["target_type"].get<std::string>());
        if (r.contains("created_at") && r["created_at"].is_number_integer())
            e.created_at = r["created_at"].get<std::int64_t>();
        e = canonical(std::move(e));
        entries_[e.key] = std::move(e);
    }
}

void JsonFileValidationCache::upsert(const ValidationCacheEntry& entry) {
    InMemoryValidationCache::upsert(entry);
    std::lock_guard<std::mutex> lk(mu_);
    save_locked();
}

void JsonFileValidationCache::save_locked() const {
    json arr = json::array();
    for (const auto& kv : entries_) {
        const auto& e = kv.second;
        arr.push_back({
            {"source_id", e.key.first},
            {"target_id", e.key.second},
            {"source_type", store::media_type_str(e.source_type)},
            {"target_type", store::media_type_str(e.target_type)},
            {"is_valid", e.is_valid},
            {"reason", e.reason},
            {"created_at", e.created_at},
        });
    }

    const std::filesystem::path p(path_);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

    // atomic replace
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) throw store::StoreError("failed to write validation cache: " + tmp);
        out << arr.dump(2) << "\n";
        if (!out) throw store::StoreError("failed to write validation cache: " + tmp);
    }
    std::filesystem::rename(tmp, p);
}

}  // namespace similarity
