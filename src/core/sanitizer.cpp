#include "sanitizer.hpp"
#include "constants.hpp"
#include <unicode/unistr.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/utf16.h>

namespace {

const std::set<std::string> SYSTEM_FILES = {
    ".DS_Store", "Thumbs.db", "thumbs.db", "desktop.ini", "Desktop.ini",
    ".localized", "$RECYCLE.BIN", "System Volume Information",
};

bool is_problematic(char32_t c) {
    switch (c) {
        case U'#': case U'@': case U'!': case U',': case U';':
        case U'[': case U']': case U'(': case U')': case U'{': case U'}':
            return true;
        default:
            return false;
    }
}

bool is_quote(char32_t c) {
    switch (c) {
        case U'\'': case U'`':
        case U'\u00B4':                    // acute accent
        case U'\u2018': case U'\u2019':    // single curly quotes
        case U'\u201A': case U'\u201B':
        case U'\u201C': case U'\u201D':    // double curly quotes
        case U'\u201E':
        case U'\u2032': case U'\u2033':    // primes
            return true;
        default:
            return false;
    }
}

bool is_space(char32_t c) {
    return u_isUWhiteSpace(static_cast<UChar32>(c));
}

bool is_space_or_underscore(char32_t c) {
    return c == U'_' || is_space(c);
}

std::u32string to_u32(const icu::UnicodeString& s) {
    std::u32string out;
    out.reserve(static_cast<size_t>(s.length()));
    for (int32_t i = 0; i < s.length();) {
        UChar32 c = s.char32At(i);
        out.push_back(static_cast<char32_t>(c));
        i += U16_LENGTH(c);
    }
    return out;
}

icu::UnicodeString nfc(const icu::UnicodeString& src) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) return src;
    icu::UnicodeString out = normalizer->normalize(src, status);
    if (U_FAILURE(status)) return src;
    return out;
}

std::string to_utf8_nfc(const std::u32string& s) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32*>(s.data()), static_cast<int32_t>(s.size()));
    // Dropping a quote can bring a base letter next to a combining mark
    std::string out;
    nfc(u).toUTF8String(out);
    return out;
}

void trim_space_and_underscore(std::u32string& s) {
    size_t start = 0;
    while (start < s.size() && is_space_or_underscore(s[start])) start++;
    size_t end = s.size();
    while (end > start && is_space_or_underscore(s[end - 1])) end--;
    s = s.substr(start, end - start);
}

std::u32string sanitize_stem(const std::u32string& stem) {
    std::u32string replaced;
    replaced.reserve(stem.size());
    for (char32_t c : stem) {
        if (FilenameSanitizer::is_forbidden(c) || is_problematic(c)) {
            replaced.push_back(U'_');
        } else if (is_quote(c)) {
            continue;
        } else {
            replaced.push_back(c);
        }
    }

    std::u32string collapsed;
    collapsed.reserve(replaced.size());
    bool in_run = false;
    for (char32_t c : replaced) {
        if (is_space_or_underscore(c)) {
            if (!in_run) collapsed.push_back(U'_');
            in_run = true;
        } else {
            collapsed.push_back(c);
            in_run = false;
        }
    }

    trim_space_and_underscore(collapsed);

    // A stem of nothing but dots would name "." or ".."
    bool only_dots = collapsed.find_first_not_of(U'.') == std::u32string::npos;
    if (collapsed.empty() || only_dots) {
        std::string placeholder = PLACEHOLDER_STEM;
        return std::u32string(placeholder.begin(), placeholder.end());
    }
    return collapsed;
}

std::u32string sanitize_extension(const std::u32string& ext) {
    std::u32string out;
    out.reserve(ext.size());
    for (char32_t c : ext) {
        out.push_back(FilenameSanitizer::is_forbidden(c) ? U'_' : c);
    }
    trim_space_and_underscore(out);
    return out;
}

} // namespace

FilenameSanitizer::FilenameSanitizer(const std::vector<std::string>& extra_excludes)
    : extra_excludes_(extra_excludes.begin(), extra_excludes.end()) {
}

bool FilenameSanitizer::is_forbidden(char32_t c) {
    switch (c) {
        case U'<': case U'>': case U':': case U'"': case U'|':
        case U'?': case U'*': case U'/': case U'\\':
            return true;
        default:
            return false;
    }
}

bool FilenameSanitizer::is_system_file(const std::string& name) const {
    return SYSTEM_FILES.count(name) > 0 || extra_excludes_.count(name) > 0;
}

std::string FilenameSanitizer::sanitize(const std::string& name) const {
    std::u32string full = to_u32(nfc(icu::UnicodeString::fromUTF8(name)));

    // A leading dot marks a hidden file, not an extension
    size_t dot = full.rfind(U'.');
    if (dot == std::u32string::npos || dot == 0) {
        return to_utf8_nfc(sanitize_stem(full));
    }

    std::u32string stem = sanitize_stem(full.substr(0, dot));
    std::u32string ext = sanitize_extension(full.substr(dot + 1));
    if (!ext.empty()) {
        return to_utf8_nfc(stem + U"." + ext);
    }

    // Nothing left after the dot. Windows strips trailing dots, so the dot
    // goes too and what remains is sanitized again as a whole name.
    while (!stem.empty() && (stem.back() == U'.' || is_space_or_underscore(stem.back()))) {
        stem.pop_back();
    }
    if (stem.empty()) return PLACEHOLDER_STEM;
    return sanitize(to_utf8_nfc(stem));
}
