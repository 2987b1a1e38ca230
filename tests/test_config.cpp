#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, DefaultsWhenEmpty) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.rclone(), "rclone");
    EXPECT_EQ(r.value.hash_chunk_size(), 64u * 1024u);
    EXPECT_EQ(r.value.local_hash(), "sha256");
    EXPECT_EQ(r.value.remote_hash(), "md5");
    EXPECT_TRUE(r.value.log_file().empty());
    EXPECT_TRUE(r.value.exclude().empty());
}

TEST(Config, ReadsAllKeys) {
    auto r = Config::parse(R"(
rclone: /opt/rclone/bin/rclone
hash_chunk_size: 4096
local_hash: md5
remote_hash: sha256
log_file: /var/tmp/sn.log
exclude:
  - .Spotlight-V100
  - .Trashes
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.rclone(), "/opt/rclone/bin/rclone");
    EXPECT_EQ(r.value.hash_chunk_size(), 4096u);
    EXPECT_EQ(r.value.local_hash(), "md5");
    EXPECT_EQ(r.value.remote_hash(), "sha256");
    EXPECT_EQ(r.value.log_file(), "/var/tmp/sn.log");
    ASSERT_EQ(r.value.exclude().size(), 2u);
    EXPECT_EQ(r.value.exclude()[1], ".Trashes");
}

TEST(Config, SingleExcludeScalar) {
    auto r = Config::parse("exclude: .Trashes\n");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.exclude().size(), 1u);
    EXPECT_EQ(r.value.exclude()[0], ".Trashes");
}

TEST(Config, RejectsBadValues) {
    EXPECT_TRUE(Config::parse("local_hash: crc32\n").is_err());
    EXPECT_TRUE(Config::parse("remote_hash: sha1\n").is_err());
    EXPECT_TRUE(Config::parse("hash_chunk_size: 0\n").is_err());
    EXPECT_TRUE(Config::parse("hash_chunk_size: -5\n").is_err());
}

TEST(Config, RejectsMalformedYaml) {
    EXPECT_TRUE(Config::parse("rclone: [unclosed\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST(Config, LoadFromMissingFileGivesDefaults) {
    auto r = Config::load_from(fs::temp_directory_path() / "safename_no_such_config.yaml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.local_hash(), "sha256");
}

TEST(Config, LoadFromFile) {
    fs::path p = fs::temp_directory_path() / "safename_config_test.yaml";
    std::ofstream(p) << "remote_hash: sha256\n";
    auto r = Config::load_from(p);
    fs::remove(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.remote_hash(), "sha256");
}

TEST(Config, GlobalPathUnderHome) {
    auto p = get_global_config_path();
    EXPECT_EQ(p.filename().string(), "config.yaml");
    EXPECT_EQ(p.parent_path().filename().string(), ".safename");
}
