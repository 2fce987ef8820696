#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

template <typename T>
static T optional_number(const json& j, const char* key, T fallback, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<T>();
}

static bool optional_bool(const json& j, const char* key, bool fallback, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

std::vector<store::Person> normalize_people(const json& j) {
    std::vector<store::Person> out;
    if (!j.is_array()) return out;

    for (const auto& e : j) {
        store::Person p;
        if (e.is_string()) {
            p.name = e.get<std::string>();
        } else if (e.is_object()) {
            auto str = [&](const char* k) {
                auto it = e.find(k);
                return (it != e.end() && it->is_string()) ? it->get<std::string>() : std::string();
            };
            p.name = str("name");
            p.role = str("role");
            p.thumb = str("thumb");
        }
        if (!p.name.empty()) out.push_back(std::move(p));
    }
    return out;
}

std::vector<std::string> normalize_names(const json& j) {
    std::vector<std::string> out;
    if (!j.is_array()) return out;

    for (const auto& e : j) {
        if (e.is_string()) {
            out.push_back(e.get<std::string>());
        } else if (e.is_object()) {
            auto it = e.find("name");
            if (it != e.end() && it->is_string()) out.push_back(it->get<std::string>());
        }
    }
    return out;
}

static json field_or_null(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? json() : *it;
}

store::MediaItem parse_media_item(const json& j, const std::string& where) {
    require_object(j, where);

    store::MediaItem m;
    m.id = require_string(j, "id", where);
    m.title = require_string(j, "title", where);
    m.year = optional_number<int>(j, "year", 0, where);
    const std::string type = optional_string(j, "type", where);
    m.type = type.empty() ? store::MediaType::Movie : store::parse_media_type(type);

    m.genres = normalize_names(field_or_null(j, "genres"));
    m.directors = normalize_names(field_or_null(j, "directors"));
    m.actors = normalize_people(field_or_null(j, "actors"));
    m.keywords = normalize_names(field_or_null(j, "keywords"));
    m.studios = normalize_names(field_or_null(j, "studios"));

    const std::string collection = optional_string(j, "collection_name", where);
    if (!collection.empty()) m.collection_name = collection;
    const std::string network = optional_string(j, "network", where);
    if (!network.empty()) m.network = network;

    if (j.contains("community_rating") && !j.at("community_rating").is_null()) {
        m.community_rating = optional_number<double>(j, "community_rating", 0.0, where);
    }
    m.content_rating = optional_string(j, "content_rating", where);
    m.overview = optional_string(j, "overview", where);
    return m;
}

static store::UserPreferences parse_preferences(const json& j, const std::string& where) {
    require_object(j, where);

    store::UserPreferences p;
    p.include_watched = optional_bool(j, "include_watched", p.include_watched, where);
    p.full_franchise_mode = optional_bool(j, "full_franchise_mode", p.full_franchise_mode, where);
    p.hide_watched = optional_bool(j, "hide_watched", p.hide_watched, where);

    const std::string dislike = optional_string(j, "dislike_behavior", where);
    if (dislike == "include") {
        p.dislike_behavior = store::DislikeBehavior::Include;
    } else if (dislike.empty() || dislike == "exclude") {
        p.dislike_behavior = store::DislikeBehavior::Exclude;
    } else {
        throw std::runtime_error(where + ".dislike_behavior must be \"exclude\" or \"include\"");
    }
    return p;
}

static store::WatchHistoryEntry parse_watch(const json& j, const std::string& where) {
    require_object(j, where);

    store::WatchHistoryEntry w;
    w.item_id = require_string(j, "item_id", where);
    w.play_count = optional_number<int>(j, "play_count", 0, where);
    w.last_played_at = optional_number<std::int64_t>(j, "last_played_at", 0, where);
    w.is_favorite = optional_bool(j, "is_favorite", false, where);
    if (j.contains("user_rating") && !j.at("user_rating").is_null()) {
        w.user_rating = optional_number<double>(j, "user_rating", 0.0, where);
    }
    return w;
}

static void parse_user(const json& j, const std::string& where, store::InMemoryLibrary& out) {
    require_object(j, where);

    store::User u;
    u.id = require_string(j, "id", where);
    u.username = optional_string(j, "username", where);
    u.enabled = optional_bool(j, "enabled", true, where);
    if (j.contains("max_parental_rating") && !j.at("max_parental_rating").is_null()) {
        u.max_parental_rating = optional_number<int>(j, "max_parental_rating", 0, where);
    }
    out.add_user(u);

    if (j.contains("preferences")) {
        out.set_preferences(u.id, parse_preferences(j.at("preferences"), where + ".preferences"));
    }

    if (j.contains("history")) {
        const json& h = j.at("history");
        require_array(h, where + ".history");
        for (size_t i = 0; i < h.size(); ++i) {
            out.add_watch(u.id, parse_watch(h.at(i), index_path(where, "history", i)));
        }
    }

    if (j.contains("ratings")) {
        const json& r = j.at("ratings");
        require_object(r, where + ".ratings");
        for (auto it = r.begin(); it != r.end(); ++it) {
            if (!it.value().is_number()) {
                throw std::runtime_error(where + ".ratings." + it.key() + " must be a number");
            }
            out.set_rating(u.id, it.key(), it.value().get<double>());
        }
    }

    if (j.contains("dislikes")) {
        const json& d = j.at("dislikes");
        require_array(d, where + ".dislikes");
        for (size_t i = 0; i < d.size(); ++i) {
            if (!d.at(i).is_string()) {
                throw std::runtime_error(index_path(where, "dislikes", i) + " must be a string");
            }
            out.add_dislike(u.id, d.at(i).get<std::string>());
        }
    }
}

void library_from_json(const json& j, store::InMemoryLibrary& out) {
    require_object(j, "root");

    if (j.contains("items")) {
        const json& items = j.at("items");
        require_array(items, "root.items");
        for (size_t i = 0; i < items.size(); ++i) {
            out.add_item(parse_media_item(items.at(i), index_path("root", "items", i)));
        }
    }

    if (j.contains("users")) {
        const json& users = j.at("users");
        require_array(users, "root.users");
        for (size_t i = 0; i < users.size(); ++i) {
            parse_user(users.at(i), index_path("root", "users", i), out);
        }
    }
}

void load_library(const std::string& path, store::InMemoryLibrary& out) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open library file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    library_from_json(j, out);
}

store::EmbeddingIndex load_vectors(const std::string& path, const store::InMemoryLibrary& library) {
    store::EmbeddingIndex index;
    index.load(path);

    std::unordered_map<std::string, int> levels;
    for (const auto& m : library.all_items()) {
        levels[m.id] = store::content_rating_level(m.content_rating);
    }
    index.set_rating_levels(std::move(levels));
    return index;
}

}  // namespace io
