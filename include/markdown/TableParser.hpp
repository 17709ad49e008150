#pragma once

#include <string>
#include <vector>

#include "markdown/Models.hpp"

namespace markdown {

// Splits one table line on unescaped '|'. "\|" becomes '|', "\\" becomes '\',
// any other backslash is kept as written. Cells are trimmed; the empty cells
// produced by a leading or trailing delimiter are dropped.
std::vector<std::string> split_cells(const std::string& line);

bool is_separator_line(const std::string& line);

// Pipe tables in document order. A block needs a header line, a separator
// line and at least one data row; header + separator alone is not a table.
// Rows whose cell count differs from the header are dropped.
std::vector<Table> parse_tables(const std::string& text);

// Same scan, also reporting every skipped block and dropped row.
TableParseResult parse_tables_detailed(const std::string& text);

}  // namespace markdown
