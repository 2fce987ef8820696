#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "jobs/ProgressReporter.hpp"
#include "jobs/StopToken.hpp"
#include "nlohmann/json.hpp"
#include "similarity/CollectionSizeCache.hpp"
#include "similarity/ConnectionReasons.hpp"
#include "similarity/ConnectionValidator.hpp"
#include "similarity/DiverseContent.hpp"
#include "similarity/GraphOptions.hpp"
#include "store/LibraryStore.hpp"
#include "store/VectorStore.hpp"

namespace similarity {

struct GraphNode {
    std::string id;
    std::string title;
    int year = 0;
    store::MediaType type = store::MediaType::Movie;
    bool is_center = false;
};

struct GraphEdge {
    std::string source;
    std::string target;
    double similarity = 0.0;
    std::vector<ConnectionReason> reasons;
};

struct GraphData {
    std::vector<GraphNode> nodes;  // seed first
    std::vector<GraphEdge> edges;  // at most one per unordered pair

    // set when the bubble escape ran
    bool ai_escape_triggered = false;
    size_t ai_nodes_added = 0;

    const GraphNode* find_node(const std::string& id) const;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// depth 1 -> limit + 1, depth 2 -> 25, deeper -> 45
size_t max_nodes_for_depth(int depth, int limit);

// Expands a graph of related titles around one seed item. Level 1 keeps the seed's nearest
// neighbors as they are; deeper levels go through collection quotas and connection validation,
// and a level that ends inside a franchise bubble asks the oracle for titles outside it.
class SimilarityGraphBuilder {
public:
    SimilarityGraphBuilder(const store::LibraryStore& library,
                           const store::VectorStore& vectors,
                           ConnectionValidator& validator,
                           DiverseContentFinder& diverse,
                           CollectionSizeCache& collection_sizes,
                           jobs::ProgressReporter& reporter);

    // Throws std::runtime_error when the seed is not in the library, jobs::OperationCancelled
    // when `stop` fires between nodes.
    GraphData build(const std::string& seed_id,
                    const GraphOptions& options,
                    const SimilarityPreferences& prefs = {},
                    const std::unordered_set<std::string>& watched = {},
                    const jobs::StopToken& stop = {});

    // Preferences and watched set taken from the user's stored settings.
    GraphData build_for_user(const std::string& seed_id,
                             const GraphOptions& options,
                             const std::string& user_id,
                             const jobs::StopToken& stop = {});

private:
    const store::LibraryStore& library_;
    const store::VectorStore& vectors_;
    ConnectionValidator& validator_;
    DiverseContentFinder& diverse_;
    CollectionSizeCache& collection_sizes_;
    jobs::ProgressReporter& reporter_;

    struct Neighbor {
        SimilarityItem item;
        double similarity = 0.0;
    };

    // up to `limit` items of the same media type, nearest first
    std::vector<Neighbor> similar_to(const SimilarityItem& item, size_t limit) const;
};

}  // namespace similarity
