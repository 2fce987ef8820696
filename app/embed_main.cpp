#include "commands/Commands.hpp"

// media-recs-embed --library <json> [--model ...] [--vocab ...] [--out ...]
int main(int argc, char** argv) {
    return cmd_embed(argc, argv);
}
