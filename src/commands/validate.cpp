#include "commands/validate.hpp"
#include "commands/project.hpp"

#include "guard/ProjectValidator.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  mdbundle validate --root <dir> [--config <path>]\n";
    return kExitFailure;
}

int cmd_validate(int argc, char** argv) {
    const std::string root = get_arg(argc, argv, "--root", "");
    const std::string config_rel = get_arg(argc, argv, "--config", "book.json");

    if (root.empty()) {
        std::cerr << "error: missing --root\n";
        return validate_usage();
    }

    guard::ProjectValidation v = guard::validate_project_path(root);
    if (v.valid) {
        try {
            OpenProject proj;
            v = open_project(root, config_rel, proj);
        } catch (const std::exception& e) {
            return report_exception(e);
        }
    }

    std::cout << validationToJson(root, v).dump(2) << "\n";

    if (!v.valid) {
        std::cerr << "validation failed: " << v.message << "\n";
        return kExitFailure;
    }

    std::cout << "VALIDATION: pass\n";
    return kExitOk;
}
