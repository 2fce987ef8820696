#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "store/MediaItem.hpp"

namespace store {

struct User {
    std::string id;
    std::string username;
    bool enabled = true;
    std::optional<int> max_parental_rating;
};

enum class DislikeBehavior {
    Exclude,
    Include
};

struct UserPreferences {
    bool include_watched = false;
    DislikeBehavior dislike_behavior = DislikeBehavior::Exclude;

    // similarity graph
    bool full_franchise_mode = false;
    bool hide_watched = true;
};

struct WatchHistoryEntry {
    std::string item_id;
    int play_count = 0;
    std::int64_t last_played_at = 0;  // unix seconds, 0 = never
    bool is_favorite = false;
    std::optional<double> user_rating;  // explicit 1..10
};

// Read side of the relational store.
class LibraryStore {
public:
    virtual ~LibraryStore() = default;

    virtual std::optional<MediaItem> get_item(const std::string& id) const = 0;
    virtual std::vector<MediaItem> items_of_type(MediaType type) const = 0;
    virtual size_t collection_size(const std::string& collection_name) const = 0;

    virtual std::vector<User> enabled_users() const = 0;
    virtual std::optional<User> get_user(const std::string& user_id) const = 0;
    virtual UserPreferences preferences(const std::string& user_id) const = 0;

    // Favorites first, then play count desc, then most recently played; at most `limit`.
    virtual std::vector<WatchHistoryEntry> watch_history(const std::string& user_id,
                                                         MediaType type,
                                                         size_t limit) const = 0;

    virtual std::unordered_set<std::string> watched_ids(const std::string& user_id, MediaType type) const = 0;
    virtual std::map<std::string, double> user_ratings(const std::string& user_id) const = 0;
    virtual std::unordered_set<std::string> disliked_ids(const std::string& user_id) const = 0;
};

class InMemoryLibrary final : public LibraryStore {
public:
    void add_item(MediaItem item);
    void add_user(User user);
    void set_preferences(const std::string& user_id, UserPreferences prefs);
    void add_watch(const std::string& user_id, WatchHistoryEntry entry);
    void set_rating(const std::string& user_id, const std::string& item_id, double rating);
    void add_dislike(const std::string& user_id, const std::string& item_id);

    size_t item_count() const { return m_items.size(); }
    std::vector<MediaItem> all_items() const;

    std::optional<MediaItem> get_item(const std::string& id) const override;
    std::vector<MediaItem> items_of_type(MediaType type) const override;
    size_t collection_size(const std::string& collection_name) const override;

    std::vector<User> enabled_users() const override;
    std::optional<User> get_user(const std::string& user_id) const override;
    UserPreferences preferences(const std::string& user_id) const override;

    std::vector<WatchHistoryEntry> watch_history(const std::string& user_id,
                                                 MediaType type,
                                                 size_t limit) const override;
    std::unordered_set<std::string> watched_ids(const std::string& user_id, MediaType type) const override;
    std::map<std::string, double> user_ratings(const std::string& user_id) const override;
    std::unordered_set<std::string> disliked_ids(const std::string& user_id) const override;

private:
    std::vector<MediaItem> m_items;                       // insertion order
    std::unordered_map<std::string, size_t> m_item_index;  // id -> m_items slot
    std::vector<User> m_users;
    std::unordered_map<std::string, UserPreferences> m_prefs;
    std::unordered_map<std::string, std::vector<WatchHistoryEntry>> m_history;
    std::unordered_map<std::string, std::map<std::string, double>> m_ratings;
    std::unordered_map<std::string, std::unordered_set<std::string>> m_dislikes;
};

}  // namespace store
