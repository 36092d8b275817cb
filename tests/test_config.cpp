#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyYieldsDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& t = r.value.transfer();
    EXPECT_EQ(t.max_retries, 5);
    EXPECT_EQ(t.chunk_prefix, "archive.part.");
    EXPECT_EQ(t.manifest_name, "archive.manifest");
    EXPECT_EQ(t.codec, "auto");
    const auto& rem = r.value.remote();
    EXPECT_EQ(rem.tmp_dir, "/tmp/chunk_transfer");
    EXPECT_EQ(rem.port, 22);
    EXPECT_FALSE(rem.ssh_key_path.has_value());
}

TEST(Config, OverridesApply) {
    auto r = Config::parse(
        "transfer:\n"
        "  max_retries: 9\n"
        "  codec: gzip\n"
        "remote:\n"
        "  tmp_dir: /var/tmp/nimbus\n"
        "  port: 2222\n"
        "  ssh_key_path: /keys/id\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.transfer().max_retries, 9);
    EXPECT_EQ(r.value.transfer().codec, "gzip");
    EXPECT_EQ(r.value.remote().tmp_dir, "/var/tmp/nimbus");
    EXPECT_EQ(r.value.remote().port, 2222);
    ASSERT_TRUE(r.value.remote().ssh_key_path.has_value());
    EXPECT_EQ(*r.value.remote().ssh_key_path, "/keys/id");
}

TEST(Config, RejectsInvalidValues) {
    EXPECT_TRUE(Config::parse("transfer:\n  max_retries: 0\n").is_err());
    EXPECT_TRUE(Config::parse("transfer:\n  codec: lz4\n").is_err());
    EXPECT_TRUE(Config::parse("transfer:\n  chunk_prefix: a/b\n").is_err());
    EXPECT_TRUE(Config::parse("transfer:\n  manifest_name: archive.part.list\n").is_err());
    EXPECT_TRUE(Config::parse("remote:\n  tmp_dir: relative/dir\n").is_err());
    EXPECT_TRUE(Config::parse("remote:\n  tmp_dir: /\n").is_err());
    EXPECT_TRUE(Config::parse("remote:\n  port: 70000\n").is_err());
}

TEST(Config, MalformedYaml) {
    EXPECT_TRUE(Config::parse("transfer: [unclosed\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST(Config, LoadFile) {
    auto path = fs::temp_directory_path() / "nimbus_config_test.yaml";
    std::ofstream(path) << "transfer:\n  max_retries: 2\n";
    auto r = Config::load_file(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.transfer().max_retries, 2);

    EXPECT_TRUE(Config::load_file(path).is_err());
}

TEST(Config, ExpandHome) {
    EXPECT_EQ(expand_home("/abs/path"), "/abs/path");
    EXPECT_NE(expand_home("~/x"), "~/x");
}
