#include "commands/outline.hpp"
#include "commands/project.hpp"

#include "io/JsonIO.hpp"
#include "markdown/OutlineParser.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_outline(int argc, char** argv) {
    const std::string root = get_arg(argc, argv, "--root", "");
    if (root.empty()) {
        std::cerr << "error: missing --root\n";
        std::cerr << "usage:\n  mdbundle outline --root <dir> [--summary <path>] [--config <path>]\n";
        return kExitFailure;
    }

    try {
        OpenProject proj;
        if (!open_project(root, get_arg(argc, argv, "--config", "book.json"), proj).valid) return kExitFailure;

        const std::string summary = get_arg(argc, argv, "--summary", proj.config.summary);

        markdown::OutlineOptions opt;
        opt.indent_width = proj.config.indent_width;
        const markdown::OutlineParseResult res = markdown::load_outline(proj.root, summary, opt);

        for (const auto& d : res.skipped) {
            std::cerr << "[warn] " << summary << ":" << d.line << ": " << d.reason << "\n";
        }
        std::cout << outlineToJson(res).dump(2) << "\n";
    } catch (const std::exception& e) {
        return report_exception(e);
    }

    return kExitOk;
}
