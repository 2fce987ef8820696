#include "commands/Commands.hpp"

#include "io/JsonIO.hpp"
#include "jobs/ProgressReporter.hpp"
#include "similarity/CollectionSizeCache.hpp"
#include "similarity/ConnectionValidator.hpp"
#include "similarity/DiverseContent.hpp"
#include "similarity/GraphBuilder.hpp"
#include "similarity/ValidationCache.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

static int graph_usage() {
    std::cerr
        << "usage:\n"
        << "  media-recs graph --library <json> --vectors <bin> --item <id> [options]\n"
        << "\n"
        << "options:\n"
        << "  --depth <n>                  1..3, default: 1\n"
        << "  --limit <n>                  neighbors per node, default: 6\n"
        << "  --user <id>                  apply the user's franchise / hide-watched settings\n"
        << "  --cache <json>               persistent validation cache\n"
        << "  --out <path>                 default: out/graph.json\n"
        << "  --config <json>\n"
        << "  --llm_model <str> | --llm_mock <json> | --no_llm\n"
        << "  --verbose\n";
    return cli::kExitUsage;
}

int cmd_graph(int argc, char** argv) {
    if (cli::has_flag(argc, argv, "--help")) return graph_usage();

    const std::string library_path = cli::get_arg(argc, argv, "--library", "");
    const std::string vectors_path = cli::get_arg(argc, argv, "--vectors", "");
    const std::string item_id = cli::get_arg(argc, argv, "--item", "");
    const std::string user_id = cli::get_arg(argc, argv, "--user", "");
    const std::string cache_path = cli::get_arg(argc, argv, "--cache", "");
    const fs::path out_path = cli::get_arg(argc, argv, "--out", "out/graph.json");
    if (library_path.empty() || vectors_path.empty() || item_id.empty()) return graph_usage();

    recs::AppConfig cfg;
    try {
        cfg = cli::load_config(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        return cli::kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return cli::kExitFailed;
    }

    jobs::ConsoleProgressReporter reporter(
        "graph", cli::has_flag(argc, argv, "--verbose") ? jobs::LogLevel::Debug : jobs::LogLevel::Info);

    try {
        store::InMemoryLibrary library;
        io::load_library(library_path, library);
        store::EmbeddingIndex vectors = io::load_vectors(vectors_path, library);

        std::unique_ptr<similarity::ValidationCache> cache;
        if (cache_path.empty()) {
            cache = std::make_unique<similarity::InMemoryValidationCache>();
        } else {
            cache = std::make_unique<similarity::JsonFileValidationCache>(cache_path);
        }

        auto oracle = cli::make_oracle(argc, argv, cfg.llm);
        similarity::ConnectionValidator validator(*cache, oracle.get(), cfg.llm.retry, reporter);
        similarity::DiverseContentFinder diverse(library, oracle.get(), cfg.llm.retry, reporter,
                                                 cfg.graph.ai_exclude_titles);
        similarity::CollectionSizeCache sizes(library);
        similarity::SimilarityGraphBuilder builder(library, vectors, validator, diverse, sizes, reporter);

        similarity::GraphData g;
        if (user_id.empty()) {
            similarity::SimilarityPreferences prefs;
            prefs.hide_watched = false;
            g = builder.build(item_id, cfg.graph, prefs);
        } else {
            if (!library.get_user(user_id)) {
                std::cerr << "error: unknown user: " << user_id << "\n";
                return cli::kExitFailed;
            }
            g = builder.build_for_user(item_id, cfg.graph, user_id);
        }

        g.write_to(out_path);

        const similarity::ValidationCacheStats stats = cache->stats();
        std::cout << "graph: " << g.nodes.size() << " nodes, " << g.edges.size() << " edges"
                  << (g.ai_escape_triggered ? " (bubble escape)" : "") << "\n";
        std::cout << "validation cache: " << stats.total << " entries (" << stats.valid << " valid, "
                  << stats.invalid << " invalid), oracle calls: " << validator.oracle_calls() << "\n";
        std::cout << "wrote: " << out_path.string() << "\n";
        return cli::kExitOk;
    } catch (const std::exception& e) {
        reporter.fail(e.what());
        std::cerr << "error: " << e.what() << "\n";
        return cli::kExitFailed;
    }
}
