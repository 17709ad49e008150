#include "markdown/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) return lines;

    size_t i = 0;
    while (i <= text.size()) {
        size_t j = text.find('\n', i);
        if (j == std::string::npos) j = text.size();
        std::string line = text.substr(i, j - i);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (j == text.size()) break;
        i = j + 1;
        // no phantom empty line after a final newline
        if (i == text.size()) break;
    }
    return lines;
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && (s[a] == ' ' || s[a] == '\t')) ++a;

    size_t b = s.size();
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t')) --b;

    return s.substr(a, b - a);
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
    }
    return true;
}

size_t indent_columns(const std::string& line, size_t tab_width) {
    size_t cols = 0;
    for (char c : line) {
        if (c == ' ') cols += 1;
        else if (c == '\t') cols += tab_width;
        else break;
    }
    return cols;
}

std::string slugify(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_dash = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));
        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_dash = false;
        } else if (!prev_dash) {
            out.push_back('-');
            prev_dash = true;
        }
    }

    if (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

bool is_fence(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && i < 3 && line[i] == ' ') ++i;
    if (i + 3 > line.size()) return false;
    const char c = line[i];
    if (c != '`' && c != '~') return false;
    return line[i + 1] == c && line[i + 2] == c;
}

}
