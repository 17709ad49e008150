#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "markdown/Models.hpp"

namespace markdown {

struct OutlineOptions {
    size_t indent_width = 2;   // columns per nesting step; a tab counts as one step
};

// Parses SUMMARY.md-style text: every "<indent>- [title](path)" line becomes
// an entry. The path runs to the last ')' on the line so targets may contain
// parentheses. Levels come from indentation, relative to the enclosing
// entries. Headings, prose and blank lines are ignored; bullet links that are
// malformed are skipped and reported.
OutlineParseResult parse_outline_text(const std::string& text, const OutlineOptions& opt = OutlineOptions{});

// Reads `file_path` through guard::read_file (rooted at its own directory).
std::vector<OutlineEntry> parse_outline(const std::filesystem::path& file_path);
OutlineParseResult parse_outline_detailed(const std::filesystem::path& file_path, const OutlineOptions& opt);

// Reads `relative` under the project root; throws guard::SecurityViolation if
// it escapes.
OutlineParseResult load_outline(const std::filesystem::path& root, const std::string& relative,
                                const OutlineOptions& opt);

}  // namespace markdown
