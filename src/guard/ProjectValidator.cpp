#include "guard/ProjectValidator.hpp"
#include "guard/PathGuard.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace guard {

static ProjectValidation reject(const std::string& msg) {
    ProjectValidation v;
    v.valid = false;
    v.message = msg;
    return v;
}

static bool has_traversal(const std::string& raw) {
    for (const auto& part : fs::path(raw)) {
        if (part == "..") return true;
    }
    return false;
}

std::vector<std::string> default_denied_dirs() {
    return {
        "/etc",
        "/bin",
        "/sbin",
        "/boot",
        "/dev",
        "/proc",
        "/sys",
        "/root",
        "/lib",
        "/lib64",
        "/usr/bin",
        "/usr/sbin",
        "/usr/lib",
        "/var/log",
        "/var/run",
    };
}

ProjectPolicy default_policy() {
    ProjectPolicy p;
    p.denied_dirs = default_denied_dirs();
    return p;
}

ProjectValidation validate_project_path(const std::string& path, const ProjectPolicy& policy) {
    if (path.empty()) return reject("Project path is empty");
    if (path.find('\0') != std::string::npos) return reject("Project path contains a NUL byte");

    // checked on the raw string: "/tmp/../etc" never gets a chance to
    // normalize into something that looks harmless
    if (has_traversal(path)) return reject("Path traversal is not allowed: " + path);

    std::error_code ec;
    const fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) return reject("Cannot resolve project path '" + path + "': " + ec.message());
    const fs::path resolved = fs::weakly_canonical(abs, ec);
    if (ec) return reject("Cannot resolve project path '" + path + "': " + ec.message());

    if (resolved == resolved.root_path()) {
        return reject("Access to system directory is not allowed: " + resolved.string());
    }

    for (const auto& dir : policy.denied_dirs) {
        const fs::path denied(dir);
        std::error_code dec;
        const fs::path denied_canon = fs::weakly_canonical(denied, dec);

        if (is_within(denied, resolved) || (!dec && is_within(denied_canon, resolved))) {
            return reject("Access to system directory is not allowed: " + dir);
        }
    }

    const auto st = fs::status(resolved, ec);
    if (st.type() == fs::file_type::not_found) {
        return reject("Project directory does not exist: " + resolved.string());
    }
    if (ec) return reject("Cannot access project path '" + resolved.string() + "': " + ec.message());
    if (!fs::is_directory(st)) return reject("Project path is not a directory: " + resolved.string());

    ProjectValidation ok;
    ok.valid = true;
    ok.message = "OK";
    return ok;
}

ProjectValidation validate_project_path(const std::string& path) {
    return validate_project_path(path, default_policy());
}

} // namespace guard
