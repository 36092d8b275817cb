#include <gtest/gtest.h>
#include <transfer/remote_transport.hpp>
#include <transfer/archive_packer.hpp>
#include <transfer/cleanup_guard.hpp>
#include <transfer/preflight.hpp>
#include <transfer/reassembler.hpp>
#include <core/errors.hpp>
#include <platform/digest.hpp>
#include <ssh/connection.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>

namespace fs = std::filesystem;

// Answers commands from a script and keeps "remote" files in memory.
class FakeConnection : public SSHConnection {
public:
    FakeConnection() : SSHConnection(nullptr, std::make_shared<std::mutex>(), -1) {}

    SSHResult run(const std::string& command, int) override {
        std::lock_guard<std::mutex> lock(mu);
        commands.push_back(command);
        for (const auto& [needle, result] : replies) {
            if (command.find(needle) != std::string::npos) return result;
        }
        return SSHResult{0, "", ""};
    }

    SSHResult upload(const fs::path& local, const std::string& remote) override {
        std::ifstream in(local, std::ios::binary);
        if (!in) return SSHResult{-1, "", "no such file"};
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::lock_guard<std::mutex> lock(mu);
        files[remote] = data;
        return SSHResult{0, "", ""};
    }

    SSHResult download(const std::string& remote, const fs::path& local) override {
        std::lock_guard<std::mutex> lock(mu);
        auto it = files.find(remote);
        if (it == files.end()) return SSHResult{1, "", "not found"};
        std::ofstream(local, std::ios::binary) << it->second;
        return SSHResult{0, "", ""};
    }

    std::mutex mu;
    std::vector<std::string> commands;
    std::vector<std::pair<std::string, SSHResult>> replies;
    std::map<std::string, std::string> files;
};

class RemoteTransportTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeConnection conn;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "nimbus_remote_transport_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST(Md5sumCheck, CollectsOkLines) {
    auto ok = parse_md5sum_check(
        "archive.part.0000: OK\r\n"
        "archive.part.0001: FAILED\n"
        "archive.part.0002: FAILED open or read\n"
        "archive.part.0003: OK\n");
    EXPECT_EQ(ok, (std::set<std::string>{"archive.part.0000", "archive.part.0003"}));
    EXPECT_TRUE(parse_md5sum_check("").empty());
}

TEST_F(RemoteTransportTest, UploadVerifiesWithMd5sumCheck) {
    Manifest m(std::vector<ManifestEntry>{{"archive.part.0000", platform::md5_hex("a")},
                {"archive.part.0001", platform::md5_hex("b")}});
    conn.replies.push_back({"md5sum -c", SSHResult{1, "archive.part.0000: OK\narchive.part.0001: FAILED\n", ""}});

    UploadTransport t(conn, test_dir, "/tmp/chunk_transfer", "archive.manifest");
    EXPECT_EQ(t.find_invalid(m), std::vector<std::string>{"archive.part.0001"});
    ASSERT_FALSE(conn.commands.empty());
    EXPECT_EQ(conn.commands.back(),
              "cd '/tmp/chunk_transfer' && LC_ALL=C md5sum -c 'archive.manifest' 2>/dev/null");
}

TEST_F(RemoteTransportTest, UnreachableVerifierMeansEverythingPending) {
    Manifest m(std::vector<ManifestEntry>{{"archive.part.0000", platform::md5_hex("a")}});
    conn.replies.push_back({"md5sum -c", SSHResult{-1, "", "channel closed"}});
    UploadTransport t(conn, test_dir, "/tmp/x", "archive.manifest");
    EXPECT_EQ(t.find_invalid(m).size(), 1u);
}

TEST_F(RemoteTransportTest, UploadCopiesBlock) {
    std::ofstream(test_dir / "archive.part.0000", std::ios::binary) << "payload";
    UploadTransport t(conn, test_dir, "/tmp/x", "archive.manifest");
    ASSERT_TRUE(t.copy_block("archive.part.0000").is_ok());
    EXPECT_EQ(conn.files["/tmp/x/archive.part.0000"], "payload");

    EXPECT_TRUE(t.copy_block("archive.part.0009").is_err());
}

TEST_F(RemoteTransportTest, DownloadVerifiesLocally) {
    Manifest m(std::vector<ManifestEntry>{{"archive.part.0000", platform::md5_hex("abc")},
                {"archive.part.0001", platform::md5_hex("def")}});
    conn.files["/tmp/x/archive.part.0000"] = "abc";
    conn.files["/tmp/x/archive.part.0001"] = "dXf";

    DownloadTransport t(conn, "/tmp/x", test_dir);
    EXPECT_EQ(t.find_invalid(m).size(), 2u);

    ASSERT_TRUE(t.copy_block("archive.part.0000").is_ok());
    ASSERT_TRUE(t.copy_block("archive.part.0001").is_ok());
    EXPECT_EQ(t.find_invalid(m), std::vector<std::string>{"archive.part.0001"});
}

TEST_F(RemoteTransportTest, RemoteSourceChecks) {
    conn.replies.push_back({"test -e '/data/missing'", SSHResult{1, "", ""}});
    try {
        check_remote_source(conn, "/data/missing");
        FAIL() << "expected Endpoint error";
    } catch (const NimbusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Endpoint);
    }

    conn.replies.push_back({"test -r '/data/locked'", SSHResult{1, "", ""}});
    EXPECT_THROW(check_remote_source(conn, "/data/locked"), NimbusError);

    EXPECT_NO_THROW(check_remote_source(conn, "/data/ok"));
}

TEST(RemotePath, SplitsParentAndBase) {
    EXPECT_EQ(split_remote_path("/data/set/"), (std::pair<std::string, std::string>{"/data", "set"}));
    EXPECT_EQ(split_remote_path("/file"), (std::pair<std::string, std::string>{"/", "file"}));
    EXPECT_EQ(split_remote_path("rel"), (std::pair<std::string, std::string>{".", "rel"}));
    EXPECT_THROW(split_remote_path("/"), NimbusError);
}

TEST_F(RemoteTransportTest, PackRemoteCommand) {
    const auto& gz = codec_info(CodecKind::Gzip);
    auto archive = pack_remote(conn, "/home/u/data", "/tmp/x", gz);
    EXPECT_EQ(archive, "/tmp/x/archive.tar.gz");
    EXPECT_EQ(conn.commands.back(),
              "tar -C '/home/u' -cf '/tmp/x/archive.tar' 'data' && gzip -f '/tmp/x/archive.tar'");

    conn.replies.push_back({"tar -C", SSHResult{2, "", "tar: data: Cannot open"}});
    EXPECT_THROW(pack_remote(conn, "/home/u/data", "/tmp/x", gz), NimbusError);
}

TEST_F(RemoteTransportTest, ReassembleRemoteFailureIsReassemblyError) {
    conn.replies.push_back({"| tar -xf -", SSHResult{2, "", "gzip: stdin: unexpected end of file"}});
    try {
        reassemble_remote(conn, "/tmp/x", "archive.part.", codec_info(CodecKind::Gzip), "/dest");
        FAIL() << "expected Reassembly error";
    } catch (const NimbusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Reassembly);
    }
    EXPECT_EQ(conn.commands.back(),
              "cd '/tmp/x' && LC_ALL=C cat 'archive.part.'* | gzip -d -c | tar -xf - -C '/dest'");
}

TEST_F(RemoteTransportTest, MissingToolsProbe) {
    conn.replies.push_back({"command -v", SSHResult{0, "zstd\r\nmd5sum\n", ""}});
    auto r = find_missing_remote_tools(conn, {"tar", "md5sum", "zstd"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, (std::set<std::string>{"md5sum", "zstd"}));
}

TEST_F(RemoteTransportTest, CleanupGuardRemovesEverythingOnce) {
    auto stage = test_dir / "stage";
    fs::create_directories(stage);
    std::ofstream(stage / "archive.tar.gz") << "x";
    std::ofstream(test_dir / "archive.part.0000") << "y";

    {
        CleanupGuard guard;
        guard.add_local_dir(stage);
        guard.add_local_files(test_dir, {"archive.part.0000", "archive.part.0001"});
        guard.set_remote(&conn, "/tmp/x");
        guard.run();
        guard.run();
    }

    EXPECT_FALSE(fs::exists(stage));
    EXPECT_FALSE(fs::exists(test_dir / "archive.part.0000"));
    ASSERT_EQ(conn.commands.size(), 1u);
    EXPECT_EQ(conn.commands[0], "rm -rf '/tmp/x'");
}
