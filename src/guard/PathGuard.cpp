#include "guard/PathGuard.hpp"
#include "guard/Errors.hpp"

#include <vector>

namespace fs = std::filesystem;

namespace guard {

static std::vector<fs::path> components(const fs::path& p) {
    std::vector<fs::path> out;
    for (const auto& part : p) {
        // trailing separator shows up as an empty element
        if (part.empty() || part == ".") continue;
        out.push_back(part);
    }
    return out;
}

bool is_within(const fs::path& root, const fs::path& candidate) {
    if (root.empty() || candidate.empty()) return false;
    if (root.is_absolute() != candidate.is_absolute()) return false;

    const auto r = components(root);
    const auto c = components(candidate);
    if (c.size() < r.size()) return false;

    for (size_t i = 0; i < r.size(); ++i) {
        if (r[i] != c[i]) return false;
    }
    return true;
}

fs::path resolve_safe(const fs::path& root, const std::string& relative, const Canonicalizer& canon) {
    if (relative.find('\0') != std::string::npos) {
        throw SecurityViolation("path contains a NUL byte");
    }
    if (root.empty()) {
        throw SecurityViolation("empty project root");
    }

    const fs::path root_canon = canon.canonicalize(root);

    // operator/ lets an absolute request replace the root; containment below
    // rejects it unless it happens to point back inside.
    const fs::path joined = relative.empty() ? root : root / fs::path(relative);
    const fs::path target = canon.canonicalize(joined);

    if (!is_within(root_canon, target)) {
        throw SecurityViolation("'" + relative + "' resolves to " + target.string() +
                                " which is outside " + root_canon.string());
    }
    return target;
}

fs::path resolve_safe(const fs::path& root, const std::string& relative) {
    return resolve_safe(root, relative, default_canonicalizer());
}

} // namespace guard
