#include "markdown/TableParser.hpp"
#include "markdown/TextUtil.hpp"

namespace markdown {

static bool is_escapable(char c) {
    return c == '|' || c == '\\';
}

static bool has_unescaped_pipe(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size() && is_escapable(line[i + 1])) {
            ++i;
            continue;
        }
        if (line[i] == '|') return true;
    }
    return false;
}

std::vector<std::string> split_cells(const std::string& line) {
    std::vector<std::string> raw;
    std::string cur;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '\\' && i + 1 < line.size() && is_escapable(line[i + 1])) {
            cur.push_back(line[i + 1]);
            ++i;
            continue;
        }
        if (c == '|') {
            raw.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    raw.push_back(cur);

    std::vector<std::string> cells;
    cells.reserve(raw.size());
    for (const auto& r : raw) cells.push_back(textutil::trim(r));

    if (cells.size() > 1 && cells.front().empty()) cells.erase(cells.begin());
    if (!cells.empty() && cells.back().empty()) cells.pop_back();
    return cells;
}

static Align align_of(const std::string& cell) {
    const bool left = !cell.empty() && cell.front() == ':';
    const bool right = !cell.empty() && cell.back() == ':';
    if (left && right) return Align::Center;
    if (left) return Align::Left;
    if (right) return Align::Right;
    return Align::None;
}

bool is_separator_line(const std::string& line) {
    bool pipe = false;
    bool dash = false;
    for (char c : line) {
        if (c == '|') pipe = true;
        else if (c == '-') dash = true;
        else if (c != ':' && c != ' ' && c != '\t') return false;
    }
    if (!pipe || !dash) return false;

    for (const auto& cell : split_cells(line)) {
        if (cell.find('-') == std::string::npos) return false;
    }
    return true;
}

static bool is_data_line(const std::string& line) {
    return !textutil::is_blank(line) && !textutil::is_fence(line) && has_unescaped_pipe(line);
}

static void skip(TableParseResult& res, size_t index, const std::string& reason) {
    Diagnostic d;
    d.line = index + 1;
    d.reason = reason;
    res.skipped.push_back(std::move(d));
}

TableParseResult parse_tables_detailed(const std::string& text) {
    TableParseResult res;
    const auto lines = textutil::split_lines(text);
    const size_t n = lines.size();

    bool in_fence = false;
    size_t i = 0;
    while (i < n) {
        const std::string& line = lines[i];

        if (textutil::is_fence(line)) {
            in_fence = !in_fence;
            ++i;
            continue;
        }
        if (in_fence || !has_unescaped_pipe(line) || is_separator_line(line) ||
            i + 1 >= n || !is_separator_line(lines[i + 1])) {
            ++i;
            continue;
        }

        Table t;
        t.headers = split_cells(line);
        t.first_line = i;
        for (const auto& cell : split_cells(lines[i + 1])) t.align.push_back(align_of(cell));

        const size_t cols = t.headers.size();
        const bool shape_ok = t.align.size() == cols;
        if (!shape_ok) {
            skip(res, i + 1, "separator has " + std::to_string(t.align.size()) + " columns, header has " +
                                 std::to_string(cols) + "; table skipped");
        }

        size_t j = i + 2;
        while (j < n && is_data_line(lines[j])) {
            if (shape_ok) {
                auto cells = split_cells(lines[j]);
                if (cells.size() == cols) {
                    t.rows.push_back(std::move(cells));
                } else {
                    skip(res, j, "row has " + std::to_string(cells.size()) + " cells, expected " +
                                     std::to_string(cols) + "; row dropped");
                }
            }
            ++j;
        }
        t.last_line = j - 1;

        if (shape_ok) {
            if (j == i + 2) {
                skip(res, i, "table has a header but no data rows; not a table");
            } else if (t.rows.empty()) {
                skip(res, i, "every data row was dropped; table skipped");
            } else {
                res.tables.push_back(std::move(t));
            }
        }
        i = j;
    }

    return res;
}

std::vector<Table> parse_tables(const std::string& text) {
    return parse_tables_detailed(text).tables;
}

}  // namespace markdown
