#pragma once

#include <filesystem>
#include <set>
#include <string>
#include "block_transport.hpp"

namespace fs = std::filesystem;

class SSHConnection;

// Names reported as "<name>: OK" by `md5sum -c`.
std::set<std::string> parse_md5sum_check(const std::string& output);

// Local blocks -> remote staging directory. Verification runs `md5sum -c`
// against the manifest copy already uploaded next to the blocks.
class UploadTransport : public BlockTransport {
public:
    UploadTransport(SSHConnection& conn, fs::path local_dir,
                    std::string remote_dir, std::string manifest_name);

    std::vector<std::string> find_invalid(const Manifest& manifest) override;
    Result<void> copy_block(const std::string& name) override;

private:
    SSHConnection& conn_;
    fs::path local_dir_;
    std::string remote_dir_;
    std::string manifest_name_;
};

// Remote staging directory -> local destination directory.
class DownloadTransport : public BlockTransport {
public:
    DownloadTransport(SSHConnection& conn, std::string remote_dir, fs::path local_dir);

    std::vector<std::string> find_invalid(const Manifest& manifest) override;
    Result<void> copy_block(const std::string& name) override;

private:
    SSHConnection& conn_;
    std::string remote_dir_;
    fs::path local_dir_;
};
