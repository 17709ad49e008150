#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace markdown {

enum class Align { None, Left, Center, Right };

struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;   // each row has headers.size() cells
    std::vector<Align> align;                     // one per column, from the separator line
    size_t first_line = 0;                        // 0-based, header line
    size_t last_line = 0;                         // 0-based, last kept-or-dropped data line
};

struct OutlineEntry {
    std::string title;
    std::string path;    // relative to the project root, as written
    int level = 0;       // 0 = top-level
    size_t line = 0;     // 1-based source line
};

// A recoverable skip: one table block, table row or outline line.
struct Diagnostic {
    size_t line = 0;     // 1-based
    std::string reason;
};

struct TableParseResult {
    std::vector<Table> tables;
    std::vector<Diagnostic> skipped;
};

struct OutlineParseResult {
    std::vector<OutlineEntry> entries;
    std::vector<Diagnostic> skipped;
};

} // namespace markdown
