#include "guard/SafeFile.hpp"
#include "guard/Errors.hpp"
#include "guard/PathGuard.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace guard {

std::string read_file(const fs::path& root, const std::string& relative, const Canonicalizer& canon) {
    const fs::path p = resolve_safe(root, relative, canon);

    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (st.type() == fs::file_type::not_found) throw FileNotFound(p.string());
    if (ec) throw IoError("failed to stat " + p.string() + ": " + ec.message());
    if (!fs::is_regular_file(st)) throw IoError("not a regular file: " + p.string());

    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) throw IoError("failed to open: " + p.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw IoError("failed while reading: " + p.string());
    return ss.str();
}

std::string read_file(const fs::path& root, const std::string& relative) {
    return read_file(root, relative, default_canonicalizer());
}

fs::path resolve_output(const fs::path& root, const std::string& relative) {
    const fs::path p = resolve_safe(root, relative);
    if (relative.empty() || p == default_canonicalizer().canonicalize(root)) {
        throw IoError("output path must name a file inside the project: '" + relative + "'");
    }

    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    if (ec) throw IoError("failed to create directory '" + p.parent_path().string() + "': " + ec.message());

    // re-check now that the parent chain exists on disk
    return resolve_safe(root, relative);
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) throw IoError("Failed to open output file: " + path.string());
    out << text;
    if (!out) throw IoError("failed while writing: " + path.string());
}

} // namespace guard
