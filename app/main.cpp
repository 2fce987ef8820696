#include "commands/Commands.hpp"

#include <iostream>
#include <string>

static int print_usage(int code) {
    std::cerr
        << "usage:\n"
        << "  media-recs recommend --library <json> --vectors <bin> --user <id> [options]\n"
        << "  media-recs rebuild   --library <json> --vectors <bin> [options]\n"
        << "  media-recs graph     --library <json> --vectors <bin> --item <id> [options]\n"
        << "  media-recs help\n"
        << "\n"
        << "vectors come from media-recs-embed (built when onnxruntime is available).\n"
        << "run `media-recs <command> --help` for command options.\n";
    return code;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage(cli::kExitUsage);

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help" || cmd == "-h") return print_usage(cli::kExitOk);

    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "rebuild")   return cmd_rebuild(argc - 1, argv + 1);
    if (cmd == "graph")     return cmd_graph(argc - 1, argv + 1);

    if (cmd == "embed") {
        std::cerr << "embedding lives in the media-recs-embed executable\n";
        return cli::kExitUsage;
    }

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage(cli::kExitUsage);
}
