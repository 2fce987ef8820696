#include "similarity/ConnectionReasons.hpp"

#include <unordered_set>

#include "util/TextUtil.hpp"

namespace similarity {

const char* connection_type_str(ConnectionType t) {
    switch (t) {
        case ConnectionType::Director: return "director";
        case ConnectionType::Actor: return "actor";
        case ConnectionType::Collection: return "collection";
        case ConnectionType::Genre: return "genre";
        case ConnectionType::Keyword: return "keyword";
        case ConnectionType::Studio: return "studio";
        case ConnectionType::Network: return "network";
        case ConnectionType::Similarity: return "similarity";
        case ConnectionType::AiDiverse: return "ai_diverse";
        default: return "unknown";
    }
}

nlohmann::json ConnectionReason::to_json() const {
    nlohmann::json j;
    j["type"] = connection_type_str(type);
    if (!value.empty()) j["value"] = value;
    if (!values.empty()) j["values"] = values;
    if (!photo.empty()) j["photo"] = photo;
    return j;
}

// a's entries (a's spelling and order) that also occur in b
static std::vector<std::string> intersect_ci(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::unordered_set<std::string> bs;
    for (const auto& s : b) bs.insert(textutil::to_lower_copy(s));

    std::vector<std::string> out;
    for (const auto& s : a) {
        if (bs.count(textutil::to_lower_copy(s))) out.push_back(s);
    }
    return out;
}

static std::vector<std::string> actor_names(const SimilarityItem& it) {
    std::vector<std::string> out;
    out.reserve(it.actors.size());
    for (const auto& p : it.actors) out.push_back(p.name);
    return out;
}

static std::string thumb_for(const std::string& name, const SimilarityItem& a, const SimilarityItem& b) {
    for (const auto* it : {&a, &b}) {
        for (const auto& p : it->actors) {
            if (textutil::iequals(p.name, name) && !p.thumb.empty()) return p.thumb;
        }
    }
    return "";
}

static ConnectionReason named(ConnectionType t, const std::vector<std::string>& shared) {
    ConnectionReason r;
    r.type = t;
    r.value = shared.front();
    if (shared.size() > 1) r.values = shared;
    return r;
}

std::vector<ConnectionReason> compute_connection_reasons(const SimilarityItem& source, const SimilarityItem& target) {
    std::vector<ConnectionReason> reasons;

    auto directors = intersect_ci(source.directors, target.directors);
    if (!directors.empty()) reasons.push_back(named(ConnectionType::Director, directors));

    auto actors = intersect_ci(actor_names(source), actor_names(target));
    if (!actors.empty()) {
        ConnectionReason r = named(ConnectionType::Actor, actors);
        r.photo = thumb_for(actors.front(), source, target);
        reasons.push_back(std::move(r));
    }

    if (source.collection_name && target.collection_name && *source.collection_name == *target.collection_name) {
        ConnectionReason r;
        r.type = ConnectionType::Collection;
        r.value = *source.collection_name;
        reasons.push_back(std::move(r));
    }

    auto genres = intersect_ci(source.genres, target.genres);
    if (!genres.empty()) {
        ConnectionReason r;
        r.type = ConnectionType::Genre;
        r.values = genres;
        reasons.push_back(std::move(r));
    }

    auto keywords = intersect_ci(source.keywords, target.keywords);
    if (keywords.size() > 3) keywords.resize(3);
    if (!keywords.empty()) {
        ConnectionReason r;
        r.type = ConnectionType::Keyword;
        r.values = keywords;
        reasons.push_back(std::move(r));
    }

    auto studios = intersect_ci(source.studios, target.studios);
    if (!studios.empty()) reasons.push_back(named(ConnectionType::Studio, studios));

    if (source.network && target.network && *source.network == *target.network) {
        ConnectionReason r;
        r.type = ConnectionType::Network;
        r.value = *source.network;
        reasons.push_back(std::move(r));
    }

    if (reasons.empty()) reasons.push_back(ConnectionReason{});
    return reasons;
}

ConnectionType primary_connection_type(const std::vector<ConnectionReason>& reasons) {
    static const ConnectionType priority[] = {
        ConnectionType::AiDiverse, ConnectionType::Collection, ConnectionType::Director,
        ConnectionType::Actor,     ConnectionType::Network,    ConnectionType::Studio,
        ConnectionType::Genre,     ConnectionType::Keyword,    ConnectionType::Similarity,
    };
    for (ConnectionType t : priority) {
        for (const auto& r : reasons) {
            if (r.type == t) return t;
        }
    }
    return ConnectionType::Similarity;
}

ConnectionReason ai_diverse_reason(const std::string& suggested_for) {
    ConnectionReason r;
    r.type = ConnectionType::AiDiverse;
    r.value = "AI suggested for fans of " + suggested_for;
    return r;
}

}  // namespace similarity
