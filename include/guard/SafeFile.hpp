#pragma once

#include "guard/Canonicalizer.hpp"

#include <filesystem>
#include <string>

namespace guard {

// Reads a file under `root`. Every access goes through resolve_safe first.
// Throws SecurityViolation, FileNotFound or IoError; the three never overlap.
std::string read_file(const std::filesystem::path& root, const std::string& relative);
std::string read_file(const std::filesystem::path& root, const std::string& relative, const Canonicalizer& canon);

// Validates a to-be-written path under `root` and creates its parent
// directories. Returns the canonical destination.
std::filesystem::path resolve_output(const std::filesystem::path& root, const std::string& relative);

// Writes `text` to a path already returned by resolve_output.
void write_text(const std::filesystem::path& path, const std::string& text);

} // namespace guard
