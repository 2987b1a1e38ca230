#pragma once

#include <string>
#include <vector>
#include <set>

// Maps raw filenames to cross-platform-safe ones. Pure, no I/O.
//
// Rules, in order: NFC normalization; <>:"|?*/\ become '_'; #@!,; and
// brackets become '_'; apostrophes and quote marks are dropped; runs of
// whitespace/underscores collapse to one '_'; leading and trailing
// whitespace/underscores are trimmed. The extension after the last '.' only
// gets forbidden-character replacement and trimming; when that leaves it
// empty the trailing dot is dropped as well ("notes." -> "notes"). An empty
// stem becomes "file". sanitize() is idempotent.
class FilenameSanitizer {
public:
    FilenameSanitizer() = default;
    explicit FilenameSanitizer(const std::vector<std::string>& extra_excludes);

    std::string sanitize(const std::string& name) const;

    bool needs_rename(const std::string& name) const {
        return sanitize(name) != name;
    }

    // OS metadata files (.DS_Store, Thumbs.db, ...) plus configured excludes.
    bool is_system_file(const std::string& name) const;

    // Characters that must never appear in a sanitized name.
    static bool is_forbidden(char32_t c);

private:
    std::set<std::string> extra_excludes_;
};
