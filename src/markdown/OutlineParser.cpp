#include "markdown/OutlineParser.hpp"
#include "markdown/TextUtil.hpp"

#include "guard/SafeFile.hpp"

namespace fs = std::filesystem;

namespace markdown {

enum class LineKind { Other, Malformed, Link };

struct ParsedLine {
    LineKind kind = LineKind::Other;
    size_t columns = 0;
    std::string title;
    std::string path;
    std::string reason;
};

static ParsedLine malformed(const std::string& reason) {
    ParsedLine p;
    p.kind = LineKind::Malformed;
    p.reason = reason;
    return p;
}

static ParsedLine parse_line(const std::string& line, size_t tab_width) {
    const std::string t = textutil::trim(line);
    if (t.size() < 2) return ParsedLine{};
    if (t[0] != '-' && t[0] != '*' && t[0] != '+') return ParsedLine{};
    if (t[1] != ' ' && t[1] != '\t') return ParsedLine{};

    // plain bullets without a link are prose, not outline entries
    const std::string rest = textutil::trim(t.substr(2));
    if (rest.empty() || rest[0] != '[') return ParsedLine{};

    const size_t close = rest.find("](");
    if (close == std::string::npos) {
        if (rest.find(']') == std::string::npos) return malformed("missing ']' in link");
        return malformed("missing '(' after link title");
    }

    const size_t open = close + 2;
    const size_t last = rest.rfind(')');
    if (last == std::string::npos || last < open) return malformed("missing ')' in link");

    ParsedLine p;
    p.title = textutil::trim(rest.substr(1, close - 1));
    p.path = textutil::trim(rest.substr(open, last - open));
    if (p.title.empty()) return malformed("empty link title");
    if (p.path.empty()) return malformed("empty link target");

    p.kind = LineKind::Link;
    p.columns = textutil::indent_columns(line, tab_width);
    return p;
}

OutlineParseResult parse_outline_text(const std::string& text, const OutlineOptions& opt) {
    OutlineParseResult res;
    const size_t unit = opt.indent_width == 0 ? 1 : opt.indent_width;

    struct Frame {
        size_t depth;
        int level;
    };
    std::vector<Frame> stack;

    const auto lines = textutil::split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        ParsedLine p = parse_line(lines[i], unit);

        if (p.kind == LineKind::Other) continue;
        if (p.kind == LineKind::Malformed) {
            Diagnostic d;
            d.line = i + 1;
            d.reason = p.reason;
            res.skipped.push_back(std::move(d));
            continue;
        }

        const size_t depth = p.columns / unit;
        while (!stack.empty() && stack.back().depth > depth) stack.pop_back();

        int level = 0;
        if (stack.empty()) {
            stack.push_back(Frame{depth, 0});
        } else if (stack.back().depth == depth) {
            level = stack.back().level;
        } else {
            level = stack.back().level + 1;
            stack.push_back(Frame{depth, level});
        }

        OutlineEntry e;
        e.title = std::move(p.title);
        e.path = std::move(p.path);
        e.level = level;
        e.line = i + 1;
        res.entries.push_back(std::move(e));
    }

    return res;
}

OutlineParseResult parse_outline_detailed(const fs::path& file_path, const OutlineOptions& opt) {
    const fs::path dir = file_path.has_parent_path() ? file_path.parent_path() : fs::path(".");
    const std::string text = guard::read_file(dir, file_path.filename().string());
    return parse_outline_text(text, opt);
}

std::vector<OutlineEntry> parse_outline(const fs::path& file_path) {
    return parse_outline_detailed(file_path, OutlineOptions{}).entries;
}

OutlineParseResult load_outline(const fs::path& root, const std::string& relative, const OutlineOptions& opt) {
    return parse_outline_text(guard::read_file(root, relative), opt);
}

}  // namespace markdown
