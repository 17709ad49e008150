#pragma once

#include <string>
#include <vector>

namespace guard {

struct ProjectValidation {
    bool valid = false;
    std::string message;
};

struct ProjectPolicy {
    std::vector<std::string> denied_dirs;   // absolute; checked component-wise
};

// /etc, /proc, /sys and the other system roots a book must never live in.
std::vector<std::string> default_denied_dirs();

ProjectPolicy default_policy();

// Coarse gate run once before a conversion. Rejections come back through the
// return value; this never throws for a rejected path.
ProjectValidation validate_project_path(const std::string& path, const ProjectPolicy& policy);
ProjectValidation validate_project_path(const std::string& path);

} // namespace guard
