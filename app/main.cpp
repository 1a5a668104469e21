#include "commands/convert_duplicates.hpp"
#include "commands/merge.hpp"
#include "commands/parse.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  catalog-indexer parse [args]\n"
        << "  catalog-indexer validate [args]\n"
        << "  catalog-indexer merge [args]\n"
        << "  catalog-indexer convert-duplicates [args]\n"
        << "  catalog-indexer help\n"
        << "\n"
        << "run 'catalog-indexer <command> --help' for options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    if (cmd == "parse")              return cmd_parse(argc - 1, argv + 1);
    if (cmd == "validate")           return cmd_validate(argc - 1, argv + 1);
    if (cmd == "merge")              return cmd_merge(argc - 1, argv + 1);
    if (cmd == "convert-duplicates") return cmd_convert_duplicates(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
