#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include "manifest.hpp"

namespace fs = std::filesystem;

// Cuts a compressed archive into fixed-size numbered block files
// (<prefix><index>, index zero-padded to `width` digits) and builds the
// manifest from what landed on disk.
class BlockSplitter {
public:
    BlockSplitter(std::string prefix, uint64_t block_size, int width = BLOCK_INDEX_WIDTH);

    // ceil(stream_length / block_size), and never less than one: an empty
    // stream still yields one empty block.
    size_t block_count(uint64_t stream_length) const;

    std::string block_name(size_t index) const;
    std::vector<std::string> block_names(size_t count) const;

    // Largest block count the index width can name (10^width).
    uint64_t max_blocks() const;

    // Throws NimbusError(Endpoint) if count blocks cannot be named.
    void check_capacity(size_t count) const;

    // Split archive into out_dir and return the manifest. Capacity is checked
    // before any block is written. Throws std::runtime_error on I/O failure.
    Manifest split(const fs::path& archive, const fs::path& out_dir) const;

    const std::string& prefix() const { return prefix_; }
    uint64_t block_size() const { return block_size_; }

private:
    std::string prefix_;
    uint64_t block_size_;
    int width_;
};
