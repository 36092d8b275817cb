#pragma once

#include <filesystem>
#include "block_transport.hpp"

namespace fs = std::filesystem;

// Both sides on this machine: blocks are copied between two directories.
class LocalTransport : public BlockTransport {
public:
    LocalTransport(fs::path source_dir, fs::path dest_dir);

    std::vector<std::string> find_invalid(const Manifest& manifest) override;
    Result<void> copy_block(const std::string& name) override;

private:
    fs::path source_dir_;
    fs::path dest_dir_;
};
