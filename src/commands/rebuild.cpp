#include "commands/Commands.hpp"

#include "io/JsonIO.hpp"
#include "jobs/ProgressReporter.hpp"
#include "recs/Pipeline.hpp"
#include "recs/RunArtifact.hpp"
#include "store/RecommendationStore.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

static int rebuild_usage() {
    std::cerr
        << "usage:\n"
        << "  media-recs rebuild --library <json> --vectors <bin> [options]\n"
        << "\n"
        << "regenerates recommendations for every enabled user; one run_<id>.json per run\n"
        << "plus summary.json in --out.\n"
        << "\n"
        << "options:\n"
        << "  --config <json>\n"
        << "  --type <movie|series>        default: movie\n"
        << "  --out <dir>                  default: out\n"
        << "  --no_explanations\n"
        << "  --llm_model <str> | --llm_mock <json> | --no_llm\n";
    return cli::kExitUsage;
}

int cmd_rebuild(int argc, char** argv) {
    if (cli::has_flag(argc, argv, "--help")) return rebuild_usage();

    const std::string library_path = cli::get_arg(argc, argv, "--library", "");
    const std::string vectors_path = cli::get_arg(argc, argv, "--vectors", "");
    const fs::path outdir = cli::get_arg(argc, argv, "--out", "out");
    if (library_path.empty() || vectors_path.empty()) return rebuild_usage();

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

    jobs::ConsoleProgressReporter reporter("rebuild");

    try {
        store::InMemoryLibrary library;
        io::load_library(library_path, library);
        store::EmbeddingIndex vectors = io::load_vectors(vectors_path, library);

        auto oracle = cli::make_oracle(argc, argv, cfg.llm);
        store::InMemoryRecommendationStore runs;
        recs::RecommendationService service(library, vectors, runs, *oracle, cfg.pipeline, cfg.llm.retry, reporter);

        service.set_publisher([&](const recs::GenerationResult& r) {
            recs::RunArtifact::load(runs, r.run_id).write_to(outdir / ("run_" + r.run_id + ".json"), &library);
        });

        const recs::RebuildSummary summary = service.clear_and_rebuild_all();
        const std::vector<std::string> publish_errors = service.wait_background();

        nlohmann::json j = summary.to_json();
        j["publish_errors"] = publish_errors;

        fs::create_directories(outdir);
        std::ofstream out(outdir / "summary.json");
        if (!out) throw std::runtime_error("Failed to write " + (outdir / "summary.json").string());
        out << j.dump(2);

        std::cout << "users: " << summary.batch.success << " ok, " << summary.batch.failed << " failed, "
                  << summary.batch.total_recommendations << " recommendations\n";
        return summary.batch.failed == 0 ? cli::kExitOk : cli::kExitFailed;
    } catch (const std::exception& e) {
        reporter.fail(e.what());
        std::cerr << "error: " << e.what() << "\n";
        return cli::kExitFailed;
    }
}
