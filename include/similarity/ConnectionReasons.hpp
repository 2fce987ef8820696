#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "similarity/SimilarityItem.hpp"

namespace similarity {

enum class ConnectionType {
    Director,
    Actor,
    Collection,
    Genre,
    Keyword,
    Studio,
    Network,
    Similarity,  // nothing shared beyond the vector match
    AiDiverse    // suggested by the oracle to escape a franchise bubble
};

const char* connection_type_str(ConnectionType t);

struct ConnectionReason {
    ConnectionType type = ConnectionType::Similarity;
    std::string value;                // primary shared value
    std::vector<std::string> values;  // all shared values when more than one
    std::string photo;                // actor thumb

    nlohmann::json to_json() const;
};

// Shared directors, actors, collection, genres, keywords (first 3), studios and network,
// compared case-insensitively. A single Similarity reason when nothing is shared.
std::vector<ConnectionReason> compute_connection_reasons(const SimilarityItem& source, const SimilarityItem& target);

// Display priority: ai_diverse, collection, director, actor, network, studio, genre, keyword.
ConnectionType primary_connection_type(const std::vector<ConnectionReason>& reasons);

ConnectionReason ai_diverse_reason(const std::string& suggested_for);

}  // namespace similarity
