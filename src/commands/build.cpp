#include "commands/build.hpp"
#include "commands/project.hpp"

#include "guard/Errors.hpp"
#include "guard/SafeFile.hpp"
#include "markdown/OutlineParser.hpp"
#include "site/HtmlRenderer.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int build_usage() {
    std::cerr
        << "usage:\n"
        << "  mdbundle build --root <dir> [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <path>      default: book.json (optional, relative to root)\n"
        << "  --summary <path>     default: SUMMARY.md or config \"summary\"\n"
        << "  --out <path>         default: book.html or config \"output\" (relative to root)\n"
        << "  --title <str>        default: config \"title\"\n"
        << "  --strict             fail on missing chapters and malformed outline lines\n";
    return kExitFailure;
}

int cmd_build(int argc, char** argv) {
    const std::string root = get_arg(argc, argv, "--root", "");
    if (root.empty()) {
        std::cerr << "error: missing --root\n";
        return build_usage();
    }
    const bool strict = has_flag(argc, argv, "--strict");

    try {
        OpenProject proj;
        if (!open_project(root, get_arg(argc, argv, "--config", "book.json"), proj).valid) return kExitFailure;

        const std::string summary = get_arg(argc, argv, "--summary", proj.config.summary);
        const std::string out_rel = get_arg(argc, argv, "--out", proj.config.output);
        const std::string title = get_arg(argc, argv, "--title", proj.config.title);

        markdown::OutlineOptions opt;
        opt.indent_width = proj.config.indent_width;
        const markdown::OutlineParseResult outline = markdown::load_outline(proj.root, summary, opt);

        for (const auto& d : outline.skipped) {
            std::cerr << "[warn] " << summary << ":" << d.line << ": " << d.reason << "\n";
        }
        if (strict && !outline.skipped.empty()) {
            std::cerr << "[error] " << outline.skipped.size() << " malformed outline line(s) in strict mode\n";
            return kExitFailure;
        }
        if (outline.entries.empty()) {
            std::cerr << "[error] no chapters found in " << summary << "\n";
            return kExitFailure;
        }

        std::vector<std::string> anchors;
        std::vector<site::ChapterPage> chapters;
        anchors.reserve(outline.entries.size());
        chapters.reserve(outline.entries.size());

        for (size_t i = 0; i < outline.entries.size(); ++i) {
            const auto& e = outline.entries[i];
            anchors.push_back(site::chapter_anchor(i, e.title));

            site::ChapterPage page;
            page.anchor = anchors.back();
            page.title = e.title;
            page.level = e.level;

            try {
                page.body_html = site::render_chapter_html(guard::read_file(proj.root, e.path));
            } catch (const guard::FileNotFound&) {
                if (strict) throw;
                std::cerr << "[warn] chapter not found, left empty: " << e.path << "\n";
            }
            chapters.push_back(std::move(page));
        }

        const std::string html = site::render_book_html(title, site::render_nav_html(outline.entries, anchors), chapters);

        const fs::path out_path = guard::resolve_output(proj.root, out_rel);
        guard::write_text(out_path, html);

        std::cout << "CHAPTERS: " << chapters.size() << "\n";
        std::cout << "OUT_HTML: " << out_path.string() << "\n";
    } catch (const std::exception& e) {
        return report_exception(e);
    }

    return kExitOk;
}
