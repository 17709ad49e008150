#pragma once

#include <filesystem>

namespace guard {

// Resolves a path to its unique absolute form: "." and ".." removed and every
// symlink along the chain followed. Components that do not exist yet are kept
// as a literal tail after the deepest existing ancestor; a dangling symlink is
// followed to its target like any other link.
class Canonicalizer {
public:
    virtual ~Canonicalizer() = default;

    virtual std::filesystem::path canonicalize(const std::filesystem::path& p) const = 0;
};

class FilesystemCanonicalizer final : public Canonicalizer {
public:
    std::filesystem::path canonicalize(const std::filesystem::path& p) const override;
};

// Process-wide instance backed by the real filesystem.
const Canonicalizer& default_canonicalizer();

} // namespace guard
