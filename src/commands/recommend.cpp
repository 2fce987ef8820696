#include "commands/Commands.hpp"

#include "io/JsonIO.hpp"
#include "jobs/ProgressReporter.hpp"
#include "recs/Pipeline.hpp"
#include "recs/RunArtifact.hpp"
#include "store/RecommendationStore.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

static int recommend_usage() {
    std::cerr
        << "usage:\n"
        << "  media-recs recommend --library <json> --vectors <bin> --user <id> [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <json>              pipeline / graph / llm settings\n"
        << "  --type <movie|series>        default: movie\n"
        << "  --max_candidates <n>         default: 500\n"
        << "  --selected <n>               default: 50\n"
        << "  --out <dir>                  default: out\n"
        << "  --no_explanations            template explanations only\n"
        << "  --llm_model <str>            default: llama3.1:8b\n"
        << "  --llm_cache <dir>            default: out/llm_cache\n"
        << "  --llm_mock <json>            scripted oracle answers\n"
        << "  --no_llm                     never call the oracle\n"
        << "  --verbose                    debug logging\n";
    return cli::kExitUsage;
}

int cmd_recommend(int argc, char** argv) {
    if (cli::has_flag(argc, argv, "--help")) return recommend_usage();

    const std::string library_path = cli::get_arg(argc, argv, "--library", "");
    const std::string vectors_path = cli::get_arg(argc, argv, "--vectors", "");
    const std::string user_id = cli::get_arg(argc, argv, "--user", "");
    const fs::path outdir = cli::get_arg(argc, argv, "--out", "out");
    if (library_path.empty() || vectors_path.empty() || user_id.empty()) return recommend_usage();

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
        "recommend", cli::has_flag(argc, argv, "--verbose") ? jobs::LogLevel::Debug : jobs::LogLevel::Info);

    try {
        store::InMemoryLibrary library;
        io::load_library(library_path, library);
        store::EmbeddingIndex vectors = io::load_vectors(vectors_path, library);

        auto user = library.get_user(user_id);
        if (!user) {
            std::cerr << "error: unknown user: " << user_id << "\n";
            return cli::kExitFailed;
        }

        auto oracle = cli::make_oracle(argc, argv, cfg.llm);
        store::InMemoryRecommendationStore runs;
        recs::RecommendationService service(library, vectors, runs, *oracle, cfg.pipeline, cfg.llm.retry, reporter);

        const recs::GenerationResult result = service.generate_for_user(*user);

        const fs::path out_path = outdir / ("run_" + result.run_id + ".json");
        recs::RunArtifact::load(runs, result.run_id).write_to(out_path, &library);

        std::cout << "run " << result.run_id << ": " << store::run_status_str(result.status) << ", "
                  << result.recommendations.size() << " recommendations\n";
        std::cout << "wrote: " << out_path.string() << "\n";
        return cli::kExitOk;
    } catch (const std::exception& e) {
        reporter.fail(e.what());
        std::cerr << "error: " << e.what() << "\n";
        return cli::kExitFailed;
    }
}
