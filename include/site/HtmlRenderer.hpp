#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "markdown/Models.hpp"

namespace site {

struct ChapterPage {
    std::string anchor;      // id of the chapter's <section>
    std::string title;
    int level = 0;
    std::string body_html;   // from render_chapter_html
};

std::string html_escape(const std::string& s);

// Unique per book: index keeps two chapters with the same title apart.
std::string chapter_anchor(size_t index, const std::string& title);

std::string render_table_html(const markdown::Table& t);

// Nested <ul> following entry levels; each item links to the chapter anchor
// at the same index in `anchors`.
std::string render_nav_html(const std::vector<markdown::OutlineEntry>& entries,
                            const std::vector<std::string>& anchors);

// Chapter text with pipe tables rendered as <table>. Everything else stays
// opaque: fenced blocks go into <pre>, other lines into escaped paragraphs.
std::string render_chapter_html(const std::string& md);

std::string render_book_html(const std::string& title,
                             const std::string& nav_html,
                             const std::vector<ChapterPage>& chapters);

} // namespace site
