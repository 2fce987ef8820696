#include "similarity/GraphBuilder.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

#include "similarity/BubbleAnalysis.hpp"
#include "similarity/ValidationCache.hpp"

namespace similarity {

const GraphNode* GraphData::find_node(const std::string& id) const {
    for (const auto& n : nodes) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

nlohmann::json GraphData::to_json() const {
    nlohmann::json j;
    nlohmann::json jn = nlohmann::json::array();
    for (const auto& n : nodes) {
        jn.push_back({
            {"id", n.id},
            {"title", n.title},
            {"year", n.year},
            {"type", store::media_type_str(n.type)},
            {"is_center", n.is_center},
        });
    }

    nlohmann::json je = nlohmann::json::array();
    for (const auto& e : edges) {
        nlohmann::json reasons = nlohmann::json::array();
        for (const auto& r : e.reasons) reasons.push_back(r.to_json());
        je.push_back({
            {"source", e.source},
            {"target", e.target},
            {"similarity", e.similarity},
            {"reasons", reasons},
            {"primary_connection_type", connection_type_str(primary_connection_type(e.reasons))},
        });
    }

    j["nodes"] = jn;
    j["edges"] = je;
    j["ai_escape"] = {{"triggered", ai_escape_triggered}, {"nodes_added", ai_nodes_added}};
    return j;
}

void GraphData::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());
    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to write graph: " + out_path.string());
    out << to_json().dump(2);
}

size_t max_nodes_for_depth(int depth, int limit) {
    if (depth <= 1) return (size_t)std::max(limit, 0) + 1;
    if (depth == 2) return 25;
    return 45;
}

SimilarityGraphBuilder::SimilarityGraphBuilder(const store::LibraryStore& library,
                                               const store::VectorStore& vectors,
                                               ConnectionValidator& validator,
                                               DiverseContentFinder& diverse,
                                               CollectionSizeCache& collection_sizes,
                                               jobs::ProgressReporter& reporter)
    : library_(library),
      vectors_(vectors),
      validator_(validator),
      diverse_(diverse),
      collection_sizes_(collection_sizes),
      reporter_(reporter) {}

std::vector<SimilarityGraphBuilder::Neighbor> SimilarityGraphBuilder::similar_to(const SimilarityItem& item,
                                                                                 size_t limit) const {
    std::vector<Neighbor> out;
    if (limit == 0) return out;

    auto vec = vectors_.get_vector(item.id);
    if (!vec) {
        reporter_.debug("no vector for " + item.title + ", no neighbors");
        return out;
    }

    // the vector store is shared by movies and series; over-fetch until enough of this type
    size_t request = limit;
    for (;;) {
        out.clear();
        const auto hits = vectors_.nearest_neighbors(*vec, {item.id}, request);
        for (const auto& h : hits) {
            auto m = library_.get_item(h.item_id);
            if (!m || m->type != item.type) continue;
            out.push_back({to_similarity_item(*m), h.similarity});
            if (out.size() == limit) break;
        }
        if (out.size() == limit || hits.size() < request) break;
        request *= 2;
    }
    return out;
}

GraphData SimilarityGraphBuilder::build(const std::string& seed_id,
                                        const GraphOptions& options,
                                        const SimilarityPreferences& prefs,
                                        const std::unordered_set<std::string>& watched,
                                        const jobs::StopToken& stop) {
    auto seed_item = library_.get_item(seed_id);
    if (!seed_item) throw std::runtime_error("Item not found: " + seed_id);

    const SimilarityItem center = to_similarity_item(*seed_item);
    const size_t limit = (size_t)std::max(options.limit, 0);
    const size_t max_nodes = max_nodes_for_depth(options.depth, options.limit);

    GraphData g;
    std::unordered_map<std::string, SimilarityItem> items_by_id;
    std::vector<SimilarityItem> all_items;  // insertion order, seed first
    std::unordered_set<std::string> seen_edges;
    std::unordered_set<std::string> processed;
    std::unordered_map<std::string, size_t> collection_counts;

    auto can_add_from_collection = [&](const SimilarityItem& it) {
        if (prefs.full_franchise_mode || !it.collection_name) return true;
        const size_t quota = collection_quota(collection_sizes_.size_of(*it.collection_name));
        return collection_counts[*it.collection_name] < quota;
    };

    auto add_node = [&](const SimilarityItem& it, bool is_center) {
        if (!is_center && prefs.hide_watched && watched.count(it.id)) return false;
        if (items_by_id.count(it.id)) return false;
        g.nodes.push_back({it.id, it.title, it.year, it.type, is_center});
        items_by_id.emplace(it.id, it);
        all_items.push_back(it);
        if (!is_center && it.collection_name) ++collection_counts[*it.collection_name];
        return true;
    };

    auto add_edge = [&](const std::string& source, const std::string& target, double sim,
                        std::vector<ConnectionReason> reasons) {
        if (!seen_edges.insert(make_pair_key(source, target).str()).second) return false;
        g.edges.push_back({source, target, sim, std::move(reasons)});
        return true;
    };

    add_node(center, true);
    processed.insert(center.id);

    std::vector<std::string> current_level;
    for (auto& n : similar_to(center, limit)) {
        if (n.item.id == center.id) continue;
        if (!add_node(n.item, false)) continue;
        add_edge(center.id, n.item.id, n.similarity, compute_connection_reasons(center, n.item));
        current_level.push_back(n.item.id);
    }

    for (int depth = 2; depth <= options.depth; ++depth) {
        stop.throw_if_stopped("similarity graph level " + std::to_string(depth));

        if (g.nodes.size() >= max_nodes) {
            reporter_.info("node cap " + std::to_string(max_nodes) + " reached before level " + std::to_string(depth));
            break;
        }

        const size_t level_limit = std::max<size_t>(2, limit / (size_t)depth);
        std::vector<std::string> next_level;
        size_t added_at_level = 0;

        for (const auto& id : current_level) {
            if (g.nodes.size() >= max_nodes) break;
            if (!processed.insert(id).second) continue;
            stop.throw_if_stopped("similarity graph node " + id);

            // copy: items_by_id may rehash while neighbors are added
            const SimilarityItem source = items_by_id.at(id);
            try {
                size_t added_for_node = 0;
                for (auto& n : similar_to(source, level_limit * 3)) {
                    if (g.nodes.size() >= max_nodes || added_for_node >= level_limit) break;
                    if (n.item.id == center.id) continue;
                    if (items_by_id.count(n.item.id)) continue;

                    if (!can_add_from_collection(n.item)) {
                        reporter_.debug("skipping " + n.item.title + ": collection over-represented");
                        continue;
                    }

                    const ConnectionValidation v = validator_.validate(source, n.item);
                    if (!v.is_valid) {
                        reporter_.debug("connection " + source.title + " -> " + n.item.title + " rejected: " +
                                        v.reason + (v.from_cache ? " (cached)" : ""));
                        continue;
                    }

                    if (!add_node(n.item, false)) continue;
                    if (add_edge(source.id, n.item.id, n.similarity, compute_connection_reasons(source, n.item))) {
                        ++added_for_node;
                        ++added_at_level;
                        if (!processed.count(n.item.id)) next_level.push_back(n.item.id);
                    }
                }
            } catch (const jobs::OperationCancelled&) {
                throw;
            } catch (const std::exception& e) {
                reporter_.warn("skipping expansion of " + source.title + ": " + e.what());
            }
        }

        const std::vector<SimilarityItem> non_seed(all_items.begin() + 1, all_items.end());
        const BubbleReport bubble = analyze_bubble(non_seed, options.bubble_threshold);

        if (bubble.is_bubbled && added_at_level < 2) {
            reporter_.info("bubble at level " + std::to_string(depth) + ": " +
                           bubble.dominant_collection.value_or("?") + " holds " +
                           std::to_string((int)(bubble.dominant_percentage * 100 + 0.5)) + "% of the graph");
            g.ai_escape_triggered = true;

            const size_t want = std::max<size_t>((size_t)std::max(options.ai_min_suggestions, 0),
                                                 limit > added_at_level ? limit - added_at_level : 0);
            try {
                const DiverseResult diverse = diverse_.find(center, all_items, want);
                for (const auto& it : diverse.items) {
                    if (g.nodes.size() >= max_nodes) break;
                    if (it.id == center.id || items_by_id.count(it.id)) continue;
                    if (!can_add_from_collection(it)) continue;
                    if (!add_node(it, false)) continue;
                    add_edge(center.id, it.id, options.ai_default_similarity, {ai_diverse_reason(center.title)});
                    next_level.push_back(it.id);
                    ++g.ai_nodes_added;
                }
            } catch (const std::exception& e) {
                reporter_.error(std::string("bubble escape failed: ") + e.what());
            }
        }

        current_level = std::move(next_level);
    }

    reporter_.debug("graph for " + center.title + ": " + std::to_string(g.nodes.size()) + " nodes, " +
                    std::to_string(g.edges.size()) + " edges");
    return g;
}

GraphData SimilarityGraphBuilder::build_for_user(const std::string& seed_id,
                                                 const GraphOptions& options,
                                                 const std::string& user_id,
                                                 const jobs::StopToken& stop) {
    const store::UserPreferences up = library_.preferences(user_id);
    SimilarityPreferences prefs;
    prefs.full_franchise_mode = up.full_franchise_mode;
    prefs.hide_watched = up.hide_watched;

    std::unordered_set<std::string> watched;
    if (prefs.hide_watched) {
        auto seed = library_.get_item(seed_id);
        if (!seed) throw std::runtime_error("Item not found: " + seed_id);
        watched = library_.watched_ids(user_id, seed->type);
    }
    return build(seed_id, options, prefs, watched, stop);
}

}  // namespace similarity
