#include "guard/Canonicalizer.hpp"
#include "guard/Errors.hpp"

#include <deque>
#include <system_error>

namespace fs = std::filesystem;

namespace guard {

static constexpr int kMaxSymlinkHops = 40;

static void push_front_components(std::deque<fs::path>& pending, const fs::path& p) {
    std::deque<fs::path> parts;
    for (const auto& c : p.relative_path()) parts.push_back(c);
    pending.insert(pending.begin(), parts.begin(), parts.end());
}

fs::path FilesystemCanonicalizer::canonicalize(const fs::path& p) const {
    std::error_code ec;
    const fs::path abs = fs::absolute(p, ec);
    if (ec) throw IoError("failed to make path absolute: " + p.string() + ": " + ec.message());

    // Walk one component at a time with symlink_status so that a link whose
    // target does not exist (yet) is still followed instead of being kept as
    // a literal name.
    fs::path out = abs.root_path();
    std::deque<fs::path> pending;
    push_front_components(pending, abs);

    int hops = 0;
    while (!pending.empty()) {
        const fs::path c = pending.front();
        pending.pop_front();

        if (c.empty() || c == ".") continue;
        if (c == "..") {
            if (out != out.root_path()) out = out.parent_path();
            continue;
        }

        const fs::path next = out / c;
        const auto st = fs::symlink_status(next, ec);
        if (st.type() == fs::file_type::not_found) {
            out = next;
            continue;
        }
        if (ec) throw IoError("failed to stat " + next.string() + ": " + ec.message());

        if (!fs::is_symlink(st)) {
            out = next;
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            throw IoError("too many levels of symbolic links: " + p.string());
        }
        const fs::path target = fs::read_symlink(next, ec);
        if (ec) throw IoError("failed to read link " + next.string() + ": " + ec.message());

        // relative targets resolve against the directory holding the link
        if (target.is_absolute()) out = target.root_path();
        push_front_components(pending, target);
    }
    return out;
}

const Canonicalizer& default_canonicalizer() {
    static const FilesystemCanonicalizer instance{};
    return instance;
}

} // namespace guard
