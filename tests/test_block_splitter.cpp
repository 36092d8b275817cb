#include <gtest/gtest.h>
#include <transfer/block_splitter.hpp>
#include <core/errors.hpp>
#include <platform/digest.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

class BlockSplitterTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "nimbus_splitter_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "out");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_stream(size_t size) {
        auto path = test_dir / "stream.bin";
        std::ofstream out(path, std::ios::binary);
        for (size_t i = 0; i < size; ++i) out.put(static_cast<char>(i * 31 % 251));
        return path;
    }
};

TEST(BlockSplitter, BlockCount) {
    BlockSplitter s("p.", 10);
    EXPECT_EQ(s.block_count(0), 1u);
    EXPECT_EQ(s.block_count(1), 1u);
    EXPECT_EQ(s.block_count(10), 1u);
    EXPECT_EQ(s.block_count(11), 2u);
    EXPECT_EQ(s.block_count(100), 10u);
}

TEST(BlockSplitter, FixedWidthNames) {
    BlockSplitter s("archive.part.", 1);
    EXPECT_EQ(s.block_name(0), "archive.part.0000");
    EXPECT_EQ(s.block_name(42), "archive.part.0042");
    EXPECT_EQ(s.block_name(9999), "archive.part.9999");
    EXPECT_EQ(s.block_names(3),
              (std::vector<std::string>{"archive.part.0000", "archive.part.0001", "archive.part.0002"}));
}

TEST(BlockSplitter, CapacityLimit) {
    BlockSplitter s("p.", 1);
    EXPECT_EQ(s.max_blocks(), 10000u);
    EXPECT_NO_THROW(s.check_capacity(10000));
    try {
        s.check_capacity(10001);
        FAIL() << "expected overflow to be rejected";
    } catch (const NimbusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Endpoint);
    }
}

TEST(BlockSplitter, NarrowWidthCapacity) {
    BlockSplitter s("p.", 1, 2);
    EXPECT_EQ(s.max_blocks(), 100u);
    EXPECT_THROW(s.check_capacity(101), NimbusError);
}

TEST_F(BlockSplitterTest, SplitsIntoExpectedBlocks) {
    auto stream = write_stream(25);
    BlockSplitter s("p.", 10);
    auto manifest = s.split(stream, test_dir / "out");

    ASSERT_EQ(manifest.size(), 3u);
    EXPECT_EQ(fs::file_size(test_dir / "out" / "p.0000"), 10u);
    EXPECT_EQ(fs::file_size(test_dir / "out" / "p.0001"), 10u);
    EXPECT_EQ(fs::file_size(test_dir / "out" / "p.0002"), 5u);

    for (const auto& e : manifest.entries()) {
        EXPECT_EQ(e.digest, platform::md5_file(test_dir / "out" / e.name));
    }
}

TEST_F(BlockSplitterTest, ExactMultipleHasNoTrailingEmptyBlock) {
    auto stream = write_stream(20);
    BlockSplitter s("p.", 10);
    auto manifest = s.split(stream, test_dir / "out");
    EXPECT_EQ(manifest.size(), 2u);
    EXPECT_FALSE(fs::exists(test_dir / "out" / "p.0002"));
}

TEST_F(BlockSplitterTest, EmptyStreamYieldsOneEmptyBlock) {
    auto stream = write_stream(0);
    BlockSplitter s("p.", 10);
    auto manifest = s.split(stream, test_dir / "out");
    ASSERT_EQ(manifest.size(), 1u);
    EXPECT_EQ(fs::file_size(test_dir / "out" / "p.0000"), 0u);
    EXPECT_EQ(manifest.entries()[0].digest, "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(BlockSplitterTest, OverflowWritesNothing) {
    auto stream = write_stream(101);
    BlockSplitter s("p.", 1, 2);
    EXPECT_THROW(s.split(stream, test_dir / "out"), NimbusError);
    EXPECT_TRUE(fs::is_empty(test_dir / "out"));
}

TEST_F(BlockSplitterTest, BlocksConcatenateToInput) {
    auto stream = write_stream(1000);
    BlockSplitter s("p.", 64);
    auto manifest = s.split(stream, test_dir / "out");

    std::string joined;
    for (const auto& name : manifest.names()) {
        std::ifstream in(test_dir / "out" / name, std::ios::binary);
        joined.append(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::ifstream orig(stream, std::ios::binary);
    std::string original((std::istreambuf_iterator<char>(orig)), std::istreambuf_iterator<char>());
    EXPECT_EQ(joined, original);
}
