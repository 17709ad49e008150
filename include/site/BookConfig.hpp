#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace site {

// Optional book.json in the project root. CLI flags override these.
struct BookConfig {
    std::string title = "Book";
    std::string summary = "SUMMARY.md";
    std::string output = "book.html";
    size_t indent_width = 2;
    std::vector<std::string> denied_dirs;   // added to the built-in deny-list
};

}  // namespace site
