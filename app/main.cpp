#include "commands/build.hpp"
#include "commands/outline.hpp"
#include "commands/tables.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  mdbundle validate --root <dir> [--config <path>]\n"
        << "  mdbundle outline --root <dir> [--summary <path>]\n"
        << "  mdbundle tables --root <dir> --chapter <path>\n"
        << "  mdbundle build --root <dir> [args]\n"
        << "  mdbundle help\n";
    return 1;
}

static int print_build_help() {
    std::cerr
        << "usage:\n"
        << "  mdbundle build --root <dir> [options]\n"
        << "\n"
        << "inputs/outputs (paths are relative to --root and may not leave it):\n"
        << "  --config <path>              default: book.json\n"
        << "  --summary <path>             default: SUMMARY.md\n"
        << "  --out <path>                 default: book.html\n"
        << "  --title <str>                default: Book\n"
        << "\n"
        << "behaviour:\n"
        << "  --strict                     fail on missing chapters and malformed outline lines\n"
        << "\n"
        << "exit codes: 0 ok, 1 failure, 2 security violation\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    if (cmd == "build" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_build_help();

    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
    if (cmd == "outline")  return cmd_outline(argc - 1, argv + 1);
    if (cmd == "tables")   return cmd_tables(argc - 1, argv + 1);
    if (cmd == "build")    return cmd_build(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
