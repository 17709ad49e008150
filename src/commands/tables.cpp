#include "commands/tables.hpp"
#include "commands/project.hpp"

#include "guard/SafeFile.hpp"
#include "io/JsonIO.hpp"
#include "markdown/TableParser.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_tables(int argc, char** argv) {
    const std::string root = get_arg(argc, argv, "--root", "");
    const std::string chapter = get_arg(argc, argv, "--chapter", "");

    if (root.empty() || chapter.empty()) {
        std::cerr << "error: missing --root or --chapter\n";
        std::cerr << "usage:\n  mdbundle tables --root <dir> --chapter <path> [--config <path>]\n";
        return kExitFailure;
    }

    try {
        OpenProject proj;
        if (!open_project(root, get_arg(argc, argv, "--config", "book.json"), proj).valid) return kExitFailure;

        const markdown::TableParseResult res = markdown::parse_tables_detailed(guard::read_file(proj.root, chapter));

        for (const auto& d : res.skipped) {
            std::cerr << "[warn] " << chapter << ":" << d.line << ": " << d.reason << "\n";
        }
        std::cout << tablesToJson(res).dump(2) << "\n";
    } catch (const std::exception& e) {
        return report_exception(e);
    }

    return kExitOk;
}
