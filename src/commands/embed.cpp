#include "commands/Commands.hpp"

#include "emb/LibraryEmbedder.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "io/JsonIO.hpp"
#include "jobs/ProgressReporter.hpp"

#include <iostream>
#include <string>

static int embed_usage() {
    std::cerr
        << "usage:\n"
        << "  media-recs embed --library <json> [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 default: data/embeddings/library.bin\n"
        << "  --model <path>               default: models/emb/model.onnx\n"
        << "  --vocab <path>               default: models/emb/vocab.txt\n"
        << "  --max_len <n>                default: 256\n";
    return cli::kExitUsage;
}

int cmd_embed(int argc, char** argv) {
    if (cli::has_flag(argc, argv, "--help")) return embed_usage();

    const std::string library_path = cli::get_arg(argc, argv, "--library", "");
    const std::string model = cli::get_arg(argc, argv, "--model", "models/emb/model.onnx");
    const std::string vocab = cli::get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");
    const std::string outp = cli::get_arg(argc, argv, "--out", "data/embeddings/library.bin");
    if (library_path.empty()) return embed_usage();

    size_t max_len = 256;
    try {
        max_len = (size_t)std::stoul(cli::get_arg(argc, argv, "--max_len", "256"));
    } catch (const std::exception&) {
        std::cerr << "error: --max_len expects a positive integer\n";
        return cli::kExitUsage;
    }

    jobs::ConsoleProgressReporter reporter("embed");

    try {
        store::InMemoryLibrary library;
        io::load_library(library_path, library);

        emb::MiniLmEmbedder embedder(model, vocab);

        emb::EmbedStats stats;
        store::EmbeddingIndex idx = emb::embed_library(library.all_items(), embedder, reporter, &stats, {}, max_len);
        if (idx.size() == 0) {
            std::cerr << "error: no item could be embedded\n";
            return cli::kExitFailed;
        }
        idx.save(outp);

        std::cout << "saved: " << outp << " (n=" << idx.size() << ", dim=" << idx.dim()
                  << ", skipped=" << stats.skipped << ")\n";
        return cli::kExitOk;
    } catch (const std::exception& e) {
        reporter.fail(e.what());
        std::cerr << "error: " << e.what() << "\n";
        return cli::kExitFailed;
    }
}
