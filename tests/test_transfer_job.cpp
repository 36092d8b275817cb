#include <gtest/gtest.h>
#include <transfer/transfer_job.hpp>
#include <core/endpoint.hpp>
#include <core/errors.hpp>
#include <core/interrupt.hpp>
#include <platform/digest.hpp>
#include <unistd.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

class TransferJobTest : public ::testing::Test {
protected:
    static constexpr uint64_t kBlock = 4ULL * 1024 * 1024;

    fs::path test_dir;
    fs::path src;
    fs::path dest;
    fs::path work;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "nimbus_transfer_job_test";
        fs::remove_all(test_dir);
        src = test_dir / "src" / "data";
        dest = test_dir / "dest";
        work = test_dir / "work";
        fs::create_directories(src / "nested");
        fs::create_directories(work);

        write_pattern(src / "big.bin", 10 * 1024 * 1024, 11);
        write_pattern(src / "nested" / "small.txt", 1024, 3);
        std::ofstream(src / "empty", std::ios::binary);
        g_interrupted = false;
    }

    void TearDown() override {
        g_interrupted = false;
        fs::remove_all(test_dir);
    }

    static void write_pattern(const fs::path& path, size_t size, unsigned seed) {
        std::ofstream out(path, std::ios::binary);
        uint32_t x = seed;
        for (size_t i = 0; i < size; ++i) {
            x = x * 1103515245u + 12345u;
            out.put(static_cast<char>(x >> 16));
        }
    }

    JobContext context(const fs::path& work_dir) {
        JobContext ctx;
        ctx.spec.source = parse_endpoint(src.string());
        ctx.spec.destination = parse_endpoint(dest.string());
        ctx.spec.block_size = kBlock;
        ctx.spec.parallel_jobs = 2;
        ctx.spec.max_rounds = 3;
        ctx.spec.mode = TransferMode::LocalToLocal;
        ctx.transfer.work_dir = work_dir.string();
        return ctx;
    }

    fs::path stage_dir(const fs::path& work_dir) const {
        return work_dir / (".nimbus-" + std::to_string(static_cast<long>(getpid())));
    }

    size_t blocks_left_in(const fs::path& dir) const {
        size_t n = 0;
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) return 0;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.path().filename().string().rfind("archive.part.", 0) == 0) ++n;
        }
        return n;
    }

    void expect_tree_copied() {
        auto out = dest / "data";
        EXPECT_EQ(platform::md5_file(out / "big.bin"), platform::md5_file(src / "big.bin"));
        EXPECT_EQ(platform::md5_file(out / "nested" / "small.txt"),
                  platform::md5_file(src / "nested" / "small.txt"));
        ASSERT_TRUE(fs::exists(out / "empty"));
        EXPECT_EQ(fs::file_size(out / "empty"), 0u);
    }
};

TEST_F(TransferJobTest, LocalTreeArrivesIntact) {
    TransferJob job(context(work));
    auto stats = job.run();

    expect_tree_copied();
    EXPECT_EQ(blocks_left_in(dest), 0u);
    EXPECT_FALSE(fs::exists(stage_dir(work)));

    EXPECT_GE(stats.blocks, 2u);
    EXPECT_EQ(stats.bytes, stats.blocks * kBlock);
    EXPECT_GE(stats.rounds, 1);
    EXPECT_GE(stats.elapsed_secs, 0.0);
}

TEST_F(TransferJobTest, WorkDirInsideSourceIsNotCopied) {
    TransferJob job(context(src));
    job.run();

    expect_tree_copied();
    EXPECT_FALSE(fs::exists(dest / "data" / stage_dir(src).filename()));
    EXPECT_FALSE(fs::exists(stage_dir(src)));
}

TEST_F(TransferJobTest, DestinationLostAfterStagingCleansUp) {
    auto ctx = context(work);
    ctx.on_step = [this](const std::string& msg) {
        if (msg.rfind("2.", 0) == 0) {
            fs::remove_all(dest);
            std::ofstream(dest) << "not a directory";
        }
    };
    TransferJob job(std::move(ctx));

    try {
        job.run();
        FAIL() << "expected TransferIncomplete";
    } catch (const NimbusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransferIncomplete);
        EXPECT_GE(e.missing_blocks(), 2u);
    }
    EXPECT_FALSE(fs::exists(stage_dir(work)));
}

TEST_F(TransferJobTest, BrokenBlockBeforeReassemblyCleansUp) {
    auto ctx = context(work);
    ctx.on_step = [this](const std::string& msg) {
        if (msg.rfind("3.", 0) == 0) {
            std::ofstream(dest / "archive.part.0001", std::ios::binary | std::ios::trunc);
        }
    };
    TransferJob job(std::move(ctx));

    try {
        job.run();
        FAIL() << "expected Reassembly error";
    } catch (const NimbusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Reassembly);
    }
    EXPECT_EQ(blocks_left_in(dest), 0u);
    EXPECT_FALSE(fs::exists(stage_dir(work)));
}

TEST_F(TransferJobTest, InterruptDuringTransferCleansUp) {
    auto ctx = context(work);
    ctx.on_step = [](const std::string& msg) {
        if (msg.rfind("2.", 0) == 0) g_interrupted = true;
    };
    TransferJob job(std::move(ctx));

    try {
        job.run();
        FAIL() << "expected Interrupted";
    } catch (const NimbusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Interrupted);
    }
    EXPECT_EQ(blocks_left_in(dest), 0u);
    EXPECT_FALSE(fs::exists(stage_dir(work)));
}
