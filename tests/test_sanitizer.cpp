#include <gtest/gtest.h>
#include <core/sanitizer.hpp>
#include <string>
#include <vector>

static const std::vector<std::string> SAMPLE_NAMES = {
    "My Document (final) v2.docx",
    "report!.pdf",
    "a:b?.txt",
    "it's.txt",
    "  spaced  .txt",
    "!!!.txt",
    "noext",
    "archive.tar.gz",
    "Cafe\xCC\x81.txt",                        // NFD e + combining acute
    "\xE2\x80\x9CQuoted\xE2\x80\x9D name.txt",   // curly double quotes
    "tab\there.txt",
    "name.",
    "x._",
    "a.(b).",
    "a_..",
    ". .",
    ".bashrc",
    "._resource",
    "__init__.py",
    "x<y>z|w*.md",
    "back\\slash.txt",
    "file.t?t",
    "a . b",
    "...",
    "_",
    " .txt",
    "[draft] {v1} #2 @home; ok,yes.txt",
    "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E \xE3\x83\x95\xE3\x82\xA1\xE3\x82\xA4\xE3\x83\xAB.txt",
    "e\xCC\x81\xE2\x80\x99\xCC\x81.txt",          // quote between combining marks
    "",
};

static bool is_space_or_underscore(char c) {
    return c == ' ' || c == '\t' || c == '_' || c == '\n' || c == '\r';
}

// ── Rules ───────────────────────────────────────────────────

TEST(Sanitizer, DocumentWithBracketsAndSpaces) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("My Document (final) v2.docx"), "My_Document_final_v2.docx");
}

TEST(Sanitizer, ForbiddenCharactersBecomeUnderscore) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("a:b?.txt"), "a_b.txt");
    EXPECT_EQ(s.sanitize("x<y>z|w*.md"), "x_y_z_w.md");
    EXPECT_EQ(s.sanitize("back\\slash.txt"), "back_slash.txt");
}

TEST(Sanitizer, ProblematicCharactersBecomeUnderscore) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("[draft] {v1} #2 @home; ok,yes.txt"), "draft_v1_2_home_ok_yes.txt");
    EXPECT_EQ(s.sanitize("report!.pdf"), "report.pdf");
}

TEST(Sanitizer, QuotesAreRemoved) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("it's.txt"), "its.txt");
    EXPECT_EQ(s.sanitize("\xE2\x80\x9CQuoted\xE2\x80\x9D name.txt"), "Quoted_name.txt");
    EXPECT_EQ(s.sanitize("rock`n`roll.mp3"), "rocknroll.mp3");
}

TEST(Sanitizer, WhitespaceCollapsesAndTrims) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("  spaced  .txt"), "spaced.txt");
    EXPECT_EQ(s.sanitize("tab\there.txt"), "tab_here.txt");
    EXPECT_EQ(s.sanitize("a _ _ b.txt"), "a_b.txt");
}

TEST(Sanitizer, EmptyStemGetsPlaceholder) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("!!!.txt"), "file.txt");
    EXPECT_EQ(s.sanitize(" .txt"), "file.txt");
    EXPECT_EQ(s.sanitize("_"), "file");
    EXPECT_EQ(s.sanitize(""), "file");
}

TEST(Sanitizer, ExtensionOnlyGetsForbiddenReplacement) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("file.t?t"), "file.t_t");
    EXPECT_EQ(s.sanitize("archive.tar.gz"), "archive.tar.gz");
    EXPECT_EQ(s.sanitize("song.mp3 "), "song.mp3");
}

TEST(Sanitizer, DotfilesHaveNoExtension) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize(".bashrc"), ".bashrc");
    EXPECT_EQ(s.sanitize("._resource"), "._resource");
    EXPECT_FALSE(s.needs_rename(".gitignore"));
}

TEST(Sanitizer, EmptyExtensionDropsTheDot) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("name."), "name");
    EXPECT_EQ(s.sanitize("x._"), "x");
    EXPECT_EQ(s.sanitize("x. "), "x");
    EXPECT_EQ(s.sanitize("a.b.."), "a.b");
    EXPECT_EQ(s.sanitize("a_.."), "a");
    EXPECT_EQ(s.sanitize("._."), "file");
}

TEST(Sanitizer, NameLeftAfterDroppingDotIsSanitizedAgain) {
    FilenameSanitizer s;
    // "a._b" would otherwise be re-read as stem "a" plus extension "_b"
    EXPECT_EQ(s.sanitize("a.(b)."), "a.b");
    EXPECT_FALSE(s.needs_rename("a.b"));
}

TEST(Sanitizer, NormalizesToNfc) {
    FilenameSanitizer s;
    // "Cafe" + U+0301 becomes "Caf" + U+00E9
    EXPECT_EQ(s.sanitize("Cafe\xCC\x81.txt"), "Caf\xC3\xA9.txt");
    EXPECT_TRUE(s.needs_rename("Cafe\xCC\x81.txt"));
    EXPECT_FALSE(s.needs_rename("Caf\xC3\xA9.txt"));
}

TEST(Sanitizer, NonLatinTextIsKept) {
    FilenameSanitizer s;
    EXPECT_EQ(s.sanitize("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E \xE3\x83\x95\xE3\x82\xA1\xE3\x82\xA4\xE3\x83\xAB.txt"),
              "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E_\xE3\x83\x95\xE3\x82\xA1\xE3\x82\xA4\xE3\x83\xAB.txt");
}

TEST(Sanitizer, NeedsRename) {
    FilenameSanitizer s;
    EXPECT_TRUE(s.needs_rename("a b.txt"));
    EXPECT_FALSE(s.needs_rename("a_b.txt"));
    EXPECT_FALSE(s.needs_rename("noext"));
    EXPECT_TRUE(s.needs_rename("__init__.py"));
}

// ── System files ────────────────────────────────────────────

TEST(Sanitizer, SystemFiles) {
    FilenameSanitizer s;
    EXPECT_TRUE(s.is_system_file(".DS_Store"));
    EXPECT_TRUE(s.is_system_file("Thumbs.db"));
    EXPECT_TRUE(s.is_system_file("desktop.ini"));
    EXPECT_TRUE(s.is_system_file("System Volume Information"));
    EXPECT_FALSE(s.is_system_file("notes.txt"));
    EXPECT_FALSE(s.is_system_file(".Spotlight-V100"));
}

TEST(Sanitizer, ExtraExcludes) {
    FilenameSanitizer s(std::vector<std::string>{".Spotlight-V100", "Icon\r"});
    EXPECT_TRUE(s.is_system_file(".Spotlight-V100"));
    EXPECT_TRUE(s.is_system_file("Icon\r"));
    EXPECT_TRUE(s.is_system_file(".DS_Store"));
}

// ── Properties ──────────────────────────────────────────────

TEST(Sanitizer, Idempotent) {
    FilenameSanitizer s;
    for (const auto& name : SAMPLE_NAMES) {
        std::string once = s.sanitize(name);
        EXPECT_EQ(s.sanitize(once), once) << "input: " << name;
        EXPECT_FALSE(s.needs_rename(once)) << "input: " << name;
    }
}

TEST(Sanitizer, OutputIsSafe) {
    FilenameSanitizer s;
    const std::string forbidden = "<>:\"|?*/\\";
    for (const auto& name : SAMPLE_NAMES) {
        std::string out = s.sanitize(name);
        ASSERT_FALSE(out.empty()) << "input: " << name;
        EXPECT_EQ(out.find_first_of(forbidden), std::string::npos) << "input: " << name;
        EXPECT_FALSE(is_space_or_underscore(out.front())) << "input: " << name;
        EXPECT_FALSE(is_space_or_underscore(out.back())) << "input: " << name;
        EXPECT_NE(out.back(), '.') << "input: " << name;
        // Non-empty stem: the name never starts with the extension separator
        // unless it was a dotfile to begin with
        if (name.empty() || name[0] != '.') {
            EXPECT_NE(out[0], '.') << "input: " << name;
        }
    }
}

TEST(Sanitizer, IsForbidden) {
    for (char32_t c : std::u32string(U"<>:\"|?*/\\")) {
        EXPECT_TRUE(FilenameSanitizer::is_forbidden(c));
    }
    EXPECT_FALSE(FilenameSanitizer::is_forbidden(U'a'));
    EXPECT_FALSE(FilenameSanitizer::is_forbidden(U'_'));
    EXPECT_FALSE(FilenameSanitizer::is_forbidden(U'.'));
}
