#include "store/LibraryStore.hpp"

#include <algorithm>

namespace store {

void InMemoryLibrary::add_item(MediaItem item) {
    auto it = m_item_index.find(item.id);
    if (it != m_item_index.end()) {
        m_items[it->second] = std::move(item);
        return;
    }
    m_item_index.emplace(item.id, m_items.size());
    m_items.push_back(std::move(item));
}

void InMemoryLibrary::add_user(User user) {
    for (auto& u : m_users) {
        if (u.id == user.id) {
            u = std::move(user);
            return;
        }
    }
    m_users.push_back(std::move(user));
}

void InMemoryLibrary::set_preferences(const std::string& user_id, UserPreferences prefs) {
    m_prefs[user_id] = prefs;
}

void InMemoryLibrary::add_watch(const std::string& user_id, WatchHistoryEntry entry) {
    auto& rows = m_history[user_id];
    for (auto& r : rows) {
        if (r.item_id == entry.item_id) {
            r = std::move(entry);
            return;
        }
    }
    rows.push_back(std::move(entry));
}

void InMemoryLibrary::set_rating(const std::string& user_id, const std::string& item_id, double rating) {
    m_ratings[user_id][item_id] = rating;
}

void InMemoryLibrary::add_dislike(const std::string& user_id, const std::string& item_id) {
    m_dislikes[user_id].insert(item_id);
}

std::vector<MediaItem> InMemoryLibrary::all_items() const {
    return m_items;
}

std::optional<MediaItem> InMemoryLibrary::get_item(const std::string& id) const {
    auto it = m_item_index.find(id);
    if (it == m_item_index.end()) return std::nullopt;
    return m_items[it->second];
}

std::vector<MediaItem> InMemoryLibrary::items_of_type(MediaType type) const {
    std::vector<MediaItem> out;
    for (const auto& m : m_items) {
        if (m.type == type) out.push_back(m);
    }
    return out;
}

size_t InMemoryLibrary::collection_size(const std::string& collection_name) const {
    size_t n = 0;
    for (const auto& m : m_items) {
        if (m.collection_name && *m.collection_name == collection_name) ++n;
    }
    return n;
}

std::vector<User> InMemoryLibrary::enabled_users() const {
    std::vector<User> out;
    for (const auto& u : m_users) {
        if (u.enabled) out.push_back(u);
    }
    return out;
}

std::optional<User> InMemoryLibrary::get_user(const std::string& user_id) const {
    for (const auto& u : m_users) {
        if (u.id == user_id) return u;
    }
    return std::nullopt;
}

UserPreferences InMemoryLibrary::preferences(const std::string& user_id) const {
    auto it = m_prefs.find(user_id);
    if (it == m_prefs.end()) return UserPreferences{};
    return it->second;
}

std::vector<WatchHistoryEntry> InMemoryLibrary::watch_history(const std::string& user_id,
                                                              MediaType type,
                                                              size_t limit) const {
    std::vector<WatchHistoryEntry> out;
    auto it = m_history.find(user_id);
    if (it == m_history.end()) return out;

    const auto rit = m_ratings.find(user_id);

    for (const auto& w : it->second) {
        auto item = m_item_index.find(w.item_id);
        // entries for items missing from the library are kept; the taste builder skips them
        if (item != m_item_index.end() && m_items[item->second].type != type) continue;

        WatchHistoryEntry e = w;
        if (!e.user_rating && rit != m_ratings.end()) {
            auto r = rit->second.find(w.item_id);
            if (r != rit->second.end()) e.user_rating = r->second;
        }
        out.push_back(std::move(e));
    }

    std::stable_sort(out.begin(), out.end(), [](const WatchHistoryEntry& a, const WatchHistoryEntry& b) {
        if (a.is_favorite != b.is_favorite) return a.is_favorite;
        if (a.play_count != b.play_count) return a.play_count > b.play_count;
        return a.last_played_at > b.last_played_at;
    });

    if (out.size() > limit) out.resize(limit);
    return out;
}

std::unordered_set<std::string> InMemoryLibrary::watched_ids(const std::string& user_id, MediaType type) const {
    std::unordered_set<std::string> out;
    auto it = m_history.find(user_id);
    if (it == m_history.end()) return out;

    for (const auto& w : it->second) {
        if (w.play_count <= 0 && !w.is_favorite) continue;
        auto item = m_item_index.find(w.item_id);
        if (item != m_item_index.end() && m_items[item->second].type != type) continue;
        out.insert(w.item_id);
    }
    return out;
}

std::map<std::string, double> InMemoryLibrary::user_ratings(const std::string& user_id) const {
    auto it = m_ratings.find(user_id);
    if (it == m_ratings.end()) return {};
    return it->second;
}

std::unordered_set<std::string> InMemoryLibrary::disliked_ids(const std::string& user_id) const {
    auto it = m_dislikes.find(user_id);
    if (it == m_dislikes.end()) return {};
    return it->second;
}

}  // namespace store
