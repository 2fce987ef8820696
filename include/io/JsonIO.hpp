#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "store/EmbeddingIndex.hpp"
#include "store/LibraryStore.hpp"
#include "store/MediaItem.hpp"

namespace io {

// Actor arrays come as bare names, {name, role, thumb} objects, or a mix of both.
// Entries without a usable name are dropped.
std::vector<store::Person> normalize_people(const nlohmann::json& j);

// Studio / genre style arrays: strings or {name} objects. null -> empty.
std::vector<std::string> normalize_names(const nlohmann::json& j);

store::MediaItem parse_media_item(const nlohmann::json& j, const std::string& where);

// Library snapshot:
// { "items": [...], "users": [{ "id", "username", "enabled", "max_parental_rating",
//   "preferences": {...}, "history": [...], "ratings": {item_id: 1..10}, "dislikes": [...] }] }
// Throws std::runtime_error naming the offending path on malformed input.
void load_library(const std::string& path, store::InMemoryLibrary& out);
void library_from_json(const nlohmann::json& j, store::InMemoryLibrary& out);

// Loads a saved index and attaches each item's content-rating level from the library.
store::EmbeddingIndex load_vectors(const std::string& path, const store::InMemoryLibrary& library);

}  // namespace io
