#include "site/HtmlRenderer.hpp"

#include "markdown/TableParser.hpp"
#include "markdown/TextUtil.hpp"

#include <string>
#include <vector>

namespace site {

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 32);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;";  break;
            case '<': out += "&lt;";   break;
            case '>': out += "&gt;";   break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:  out += c;        break;
        }
    }
    return out;
}

std::string chapter_anchor(size_t index, const std::string& title) {
    std::string slug = textutil::slugify(title);
    std::string a = "ch-" + std::to_string(index + 1);
    if (!slug.empty()) a += "-" + slug;
    return a;
}

static const char* align_attr(markdown::Align a) {
    switch (a) {
        case markdown::Align::Left:   return " style=\"text-align:left\"";
        case markdown::Align::Center: return " style=\"text-align:center\"";
        case markdown::Align::Right:  return " style=\"text-align:right\"";
        default:                      return "";
    }
}

std::string render_table_html(const markdown::Table& t) {
    std::string html;
    html += "<table>\n<thead>\n<tr>";
    for (size_t c = 0; c < t.headers.size(); ++c) {
        html += "<th";
        if (c < t.align.size()) html += align_attr(t.align[c]);
        html += ">" + html_escape(t.headers[c]) + "</th>";
    }
    html += "</tr>\n</thead>\n<tbody>\n";

    for (const auto& row : t.rows) {
        html += "<tr>";
        for (size_t c = 0; c < row.size(); ++c) {
            html += "<td";
            if (c < t.align.size()) html += align_attr(t.align[c]);
            html += ">" + html_escape(row[c]) + "</td>";
        }
        html += "</tr>\n";
    }

    html += "</tbody>\n</table>\n";
    return html;
}

std::string render_nav_html(const std::vector<markdown::OutlineEntry>& entries,
                            const std::vector<std::string>& anchors) {
    std::string html;
    int depth = -1;   // number of open <ul> minus one

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        const int level = e.level < 0 ? 0 : e.level;

        if (level > depth) {
            // the outline parser only ever steps one level deeper
            while (depth < level) {
                html += "\n<ul>";
                ++depth;
            }
        } else {
            html += "</li>";
            while (depth > level) {
                html += "\n</ul></li>";
                --depth;
            }
        }

        const std::string href = i < anchors.size() ? anchors[i] : std::string();
        html += "\n<li><a href=\"#" + html_escape(href) + "\">" + html_escape(e.title) + "</a>";
    }

    if (depth >= 0) {
        html += "</li>";
        while (depth > 0) {
            html += "\n</ul></li>";
            --depth;
        }
        html += "\n</ul>\n";
    }
    return html;
}

static void flush_paragraph(std::string& html, std::vector<std::string>& lines) {
    if (lines.empty()) return;

    html += "<p>";
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) html += "<br/>";
        html += html_escape(lines[i]);
    }
    html += "</p>\n";
    lines.clear();
}

std::string render_chapter_html(const std::string& md) {
    const auto lines = textutil::split_lines(md);
    const auto tables = markdown::parse_tables(md);

    std::string html;
    html.reserve(md.size() + 1024);

    std::vector<std::string> para_lines;
    size_t next_table = 0;
    bool in_fence = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        if (in_fence) {
            if (textutil::is_fence(line)) {
                html += "</code></pre>\n";
                in_fence = false;
            } else {
                html += html_escape(line) + "\n";
            }
            continue;
        }

        if (textutil::is_fence(line)) {
            flush_paragraph(html, para_lines);
            html += "<pre><code>";
            in_fence = true;
            continue;
        }

        if (next_table < tables.size() && tables[next_table].first_line == i) {
            flush_paragraph(html, para_lines);
            html += render_table_html(tables[next_table]);
            i = tables[next_table].last_line;
            ++next_table;
            continue;
        }

        if (textutil::is_blank(line)) {
            flush_paragraph(html, para_lines);
            continue;
        }

        para_lines.push_back(line);
    }

    flush_paragraph(html, para_lines);
    if (in_fence) html += "</code></pre>\n";
    return html;
}

std::string render_book_html(const std::string& title,
                             const std::string& nav_html,
                             const std::vector<ChapterPage>& chapters) {
    std::string html;

    html += "<!doctype html>\n";
    html += "<html>\n<head>\n";
    html += "<meta charset=\"utf-8\"/>\n";
    html += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\"/>\n";
    html += "<title>" + html_escape(title) + "</title>\n";
    html += "<style>\n";
    html += "  body { font-family: Arial, Helvetica, sans-serif; font-size: 11pt; line-height: 1.45; margin: 0; }\n";
    html += "  nav { position: fixed; top: 0; left: 0; bottom: 0; width: 260px; overflow-y: auto; padding: 12px; border-right: 1px solid #ddd; }\n";
    html += "  main { margin-left: 290px; padding: 12px 24px; max-width: 860px; }\n";
    html += "  nav ul { margin: 0 0 0 14px; padding: 0; list-style: none; }\n";
    html += "  table { border-collapse: collapse; margin: 8px 0; }\n";
    html += "  th, td { border: 1px solid #ccc; padding: 4px 8px; }\n";
    html += "  pre { background: #f6f6f6; padding: 8px; overflow-x: auto; }\n";
    html += "</style>\n";
    html += "</head>\n<body>\n";

    html += "<nav>\n<h1>" + html_escape(title) + "</h1>" + nav_html + "</nav>\n";
    html += "<main>\n";
    for (const auto& ch : chapters) {
        html += "<section id=\"" + html_escape(ch.anchor) + "\" data-level=\"" + std::to_string(ch.level) + "\">\n";
        html += "<h2>" + html_escape(ch.title) + "</h2>\n";
        html += ch.body_html;
        html += "</section>\n";
    }
    html += "</main>\n";

    html += "</body>\n</html>\n";
    return html;
}

} // namespace site
