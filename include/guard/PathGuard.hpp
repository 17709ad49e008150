#pragma once

#include "guard/Canonicalizer.hpp"

#include <filesystem>
#include <string>

namespace guard {

// Component-wise containment over already-canonical paths. Non-strict:
// a path is within itself. "/base2" is not within "/base".
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Joins `relative` onto `root`, canonicalizes both through `canon`, and
// returns the canonical target only if it stays inside the canonical root.
// Throws SecurityViolation when the target escapes (via "..", an absolute
// request, or a symlink anywhere along the chain). Targets that do not
// exist yet are checked through their deepest existing ancestor.
std::filesystem::path resolve_safe(const std::filesystem::path& root,
                                   const std::string& relative,
                                   const Canonicalizer& canon);

std::filesystem::path resolve_safe(const std::filesystem::path& root, const std::string& relative);

} // namespace guard
