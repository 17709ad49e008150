#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

// split on '\n', dropping a trailing '\r' from each line; "" yields no lines
std::vector<std::string> split_lines(const std::string& text);

// strip spaces and tabs from both ends
std::string trim(const std::string& s);

bool is_blank(const std::string& s);

// leading whitespace width in columns, a tab counting as tab_width
size_t indent_columns(const std::string& line, size_t tab_width);

// lowercase ascii letters/digits joined by '-', for HTML anchors
std::string slugify(const std::string& s);

// "```" or "~~~" fence opener/closer (up to 3 spaces of indent)
bool is_fence(const std::string& line);

}
