#include <gtest/gtest.h>
#include <operations/local_operations.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class LocalOperationsTest : public ::testing::Test {
protected:
    fs::path test_dir;
    LocalFileOperations ops;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "safename_local_ops_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string path(const std::string& name) const { return (test_dir / name).string(); }

    void write_file(const std::string& name, const std::string& content) {
        std::ofstream(test_dir / name, std::ios::binary) << content;
    }

    std::string read_file(const std::string& name) {
        std::ifstream in(test_dir / name, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LocalOperationsTest, PreflightChecksDirectory) {
    EXPECT_TRUE(ops.preflight(test_dir.string()).is_ok());
    EXPECT_TRUE(ops.preflight(path("missing")).is_err());

    write_file("plain.txt", "x");
    auto r = ops.preflight(path("plain.txt"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not a directory"), std::string::npos);
}

TEST_F(LocalOperationsTest, ListEntries) {
    write_file("a b.txt", "1");
    fs::create_directories(test_dir / "sub dir");

    auto r = ops.list_entries(test_dir.string());
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);

    auto entries = r.value;
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    EXPECT_EQ(entries[0].name, "a b.txt");
    EXPECT_FALSE(entries[0].is_directory);
    EXPECT_EQ(entries[1].name, "sub dir");
    EXPECT_TRUE(entries[1].is_directory);
}

TEST_F(LocalOperationsTest, ListMissingDirectoryFails) {
    EXPECT_TRUE(ops.list_entries(path("nope")).is_err());
}

TEST_F(LocalOperationsTest, Exists) {
    write_file("here.txt", "");
    auto yes = ops.exists(path("here.txt"));
    auto no = ops.exists(path("gone.txt"));
    ASSERT_TRUE(yes.is_ok());
    ASSERT_TRUE(no.is_ok());
    EXPECT_TRUE(yes.value);
    EXPECT_FALSE(no.value);
}

TEST_F(LocalOperationsTest, SameFile) {
    write_file("one.txt", "1");
    write_file("two.txt", "1");

    auto self = ops.same_file(path("one.txt"), path("one.txt"));
    auto other = ops.same_file(path("one.txt"), path("two.txt"));
    auto missing = ops.same_file(path("one.txt"), path("none.txt"));
    ASSERT_TRUE(self.is_ok());
    ASSERT_TRUE(other.is_ok());
    ASSERT_TRUE(missing.is_ok()) << missing.error;
    EXPECT_TRUE(self.value);
    EXPECT_FALSE(other.value);
    EXPECT_FALSE(missing.value);
}

TEST_F(LocalOperationsTest, NoStoredHash) {
    write_file("one.txt", "1");
    auto r = ops.stored_hash(path("one.txt"), "sha256");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.has_value());
}

TEST_F(LocalOperationsTest, MoveRenames) {
    write_file("a b.txt", "payload");
    ASSERT_TRUE(ops.move(path("a b.txt"), path("a_b.txt")).is_ok());
    EXPECT_FALSE(fs::exists(test_dir / "a b.txt"));
    EXPECT_EQ(read_file("a_b.txt"), "payload");
}

TEST_F(LocalOperationsTest, MoveNeverReplaces) {
    write_file("src.txt", "new");
    write_file("dst.txt", "old");
    auto r = ops.move(path("src.txt"), path("dst.txt"));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(read_file("src.txt"), "new");
    EXPECT_EQ(read_file("dst.txt"), "old");
}

TEST_F(LocalOperationsTest, TextRoundTripAndReplace) {
    auto absent = ops.read_text(path("none.json"));
    ASSERT_TRUE(absent.is_ok());
    EXPECT_FALSE(absent.value.has_value());

    ASSERT_TRUE(ops.write_text(path("doc.json.tmp"), "{\"v\":2}").is_ok());
    write_file("doc.json", "{\"v\":1}");
    ASSERT_TRUE(ops.replace(path("doc.json.tmp"), path("doc.json")).is_ok());

    auto text = ops.read_text(path("doc.json"));
    ASSERT_TRUE(text.is_ok());
    ASSERT_TRUE(text.value.has_value());
    EXPECT_EQ(*text.value, "{\"v\":2}");
    EXPECT_FALSE(fs::exists(test_dir / "doc.json.tmp"));
}

TEST_F(LocalOperationsTest, OpenForReadStreamsContent) {
    write_file("data.bin", std::string("ab\0cd", 5));
    auto stream = ops.open_for_read(path("data.bin"));
    ASSERT_TRUE(stream.is_ok()) << stream.error;

    std::string got;
    char buf[2];
    while (true) {
        auto n = stream.value->read(buf, sizeof(buf));
        ASSERT_TRUE(n.is_ok());
        if (n.value == 0) break;
        got.append(buf, n.value);
    }
    EXPECT_TRUE(stream.value->finish().is_ok());
    EXPECT_EQ(got, std::string("ab\0cd", 5));

    EXPECT_TRUE(ops.open_for_read(path("missing.bin")).is_err());
}

TEST_F(LocalOperationsTest, JoinKeepsRootsAndSeparators) {
    EXPECT_EQ(ops.join("/home/u/docs", "a.txt"), "/home/u/docs/a.txt");
    EXPECT_EQ(ops.join("/home/u/docs/", "a.txt"), "/home/u/docs/a.txt");
    EXPECT_EQ(ops.join("\\\\server\\share\\folder", "a.txt"), "\\\\server\\share\\folder\\a.txt");
    EXPECT_EQ(ops.join("\\\\server\\share\\", "a.txt"), "\\\\server\\share\\a.txt");
    EXPECT_EQ(ops.join("C:/Users/Me/Downloads", "a.txt"), "C:/Users/Me/Downloads/a.txt");
    EXPECT_EQ(ops.join("C:\\Users", "a.txt"), "C:\\Users\\a.txt");
}

TEST_F(LocalOperationsTest, BackendIdentity) {
    EXPECT_EQ(ops.failure_kind(), ErrorKind::IOFailure);
    EXPECT_EQ(ops.backend_name(), "local");
}

#ifndef _WIN32

// ── Symbolic links ──────────────────────────────────────────

TEST_F(LocalOperationsTest, ListReportsLinksWithoutFollowingThem) {
    fs::create_directories(test_dir / "real dir");
    write_file("real.txt", "r");
    fs::create_directory_symlink("real dir", test_dir / "dir link");
    fs::create_symlink("real.txt", test_dir / "file link");
    fs::create_symlink("nowhere", test_dir / "dangling");

    auto r = ops.list_entries(test_dir.string());
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto entries = r.value;
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    ASSERT_EQ(entries.size(), 5u);

    EXPECT_EQ(entries[0].name, "dangling");
    EXPECT_TRUE(entries[0].is_symlink);
    EXPECT_FALSE(entries[0].is_directory);
    EXPECT_TRUE(entries[0].error.empty());

    EXPECT_EQ(entries[1].name, "dir link");
    EXPECT_TRUE(entries[1].is_symlink);
    EXPECT_TRUE(entries[1].is_directory);

    EXPECT_EQ(entries[2].name, "file link");
    EXPECT_TRUE(entries[2].is_symlink);
    EXPECT_FALSE(entries[2].is_directory);

    EXPECT_EQ(entries[3].name, "real dir");
    EXPECT_FALSE(entries[3].is_symlink);
    EXPECT_TRUE(entries[3].is_directory);

    EXPECT_EQ(entries[4].name, "real.txt");
    EXPECT_FALSE(entries[4].is_symlink);
}

TEST_F(LocalOperationsTest, UnresolvableLinkCarriesError) {
    fs::create_symlink("loop", test_dir / "loop");

    auto r = ops.list_entries(test_dir.string());
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_TRUE(r.value[0].is_symlink);
    EXPECT_FALSE(r.value[0].is_directory);
    EXPECT_NE(r.value[0].error.find("loop"), std::string::npos);
}

TEST_F(LocalOperationsTest, LinkIsNotTheSameFileAsItsTarget) {
    write_file("real.txt", "r");
    fs::create_symlink("real.txt", test_dir / "link.txt");
    auto r = ops.same_file(path("link.txt"), path("real.txt"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value);
}

TEST_F(LocalOperationsTest, HardLinksAreTheSameFile) {
    write_file("real.txt", "r");
    fs::create_hard_link(test_dir / "real.txt", test_dir / "twin.txt");
    auto r = ops.same_file(path("real.txt"), path("twin.txt"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value);
}

#endif
