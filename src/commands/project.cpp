#include "commands/project.hpp"

#include "guard/Canonicalizer.hpp"
#include "guard/Errors.hpp"
#include "io/JsonIO.hpp"

#include <iostream>

guard::ProjectValidation open_project(const std::string& root, const std::string& config_rel, OpenProject& out) {
    const guard::ProjectValidation base = guard::validate_project_path(root);
    if (!base.valid) {
        std::cerr << "[error] invalid project root: " << base.message << "\n";
        return base;
    }

    out.root = guard::default_canonicalizer().canonicalize(root);
    out.config = loadBookConfig(out.root, config_rel);

    if (!out.config.denied_dirs.empty()) {
        guard::ProjectPolicy policy = guard::default_policy();
        policy.denied_dirs.insert(policy.denied_dirs.end(), out.config.denied_dirs.begin(), out.config.denied_dirs.end());

        const guard::ProjectValidation v = guard::validate_project_path(out.root.string(), policy);
        if (!v.valid) {
            std::cerr << "[error] invalid project root: " << v.message << "\n";
            return v;
        }
    }

    return base;
}

int report_exception(const std::exception& e) {
    std::cerr << "[error] " << e.what() << "\n";
    if (dynamic_cast<const guard::SecurityViolation*>(&e) != nullptr) return kExitSecurity;
    return kExitFailure;
}
