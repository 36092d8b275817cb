#include "block_splitter.hpp"
#include <core/errors.hpp>
#include <core/interrupt.hpp>
#include <platform/digest.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

BlockSplitter::BlockSplitter(std::string prefix, uint64_t block_size, int width)
    : prefix_(std::move(prefix)), block_size_(block_size), width_(width) {
    if (block_size_ == 0) {
        throw NimbusError(ErrorKind::Usage, "Block size must be positive");
    }
}

size_t BlockSplitter::block_count(uint64_t stream_length) const {
    if (stream_length == 0) return 1;
    return static_cast<size_t>((stream_length + block_size_ - 1) / block_size_);
}

std::string BlockSplitter::block_name(size_t index) const {
    return fmt::format("{}{:0{}}", prefix_, index, width_);
}

std::vector<std::string> BlockSplitter::block_names(size_t count) const {
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) names.push_back(block_name(i));
    return names;
}

uint64_t BlockSplitter::max_blocks() const {
    uint64_t n = 1;
    for (int i = 0; i < width_; ++i) n *= 10;
    return n;
}

void BlockSplitter::check_capacity(size_t count) const {
    if (count > max_blocks()) {
        throw NimbusError(ErrorKind::Endpoint,
            fmt::format("Archive needs {} blocks but at most {} can be named; "
                        "use a larger block size", count, max_blocks()));
    }
}

Manifest BlockSplitter::split(const fs::path& archive, const fs::path& out_dir) const {
    uint64_t length = fs::file_size(archive);
    size_t count = block_count(length);
    check_capacity(count);

    std::ifstream in(archive, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open archive: " + archive.string());

    std::vector<char> buf(ARCHIVE_BUF_SIZE);
    std::vector<std::string> names = block_names(count);

    for (const auto& name : names) {
        check_interrupted();
        auto path = out_dir / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Cannot create block: " + path.string());

        uint64_t left = block_size_;
        while (left > 0 && in) {
            auto want = static_cast<std::streamsize>(std::min<uint64_t>(left, buf.size()));
            in.read(buf.data(), want);
            auto got = in.gcount();
            if (got <= 0) break;
            out.write(buf.data(), got);
            left -= static_cast<uint64_t>(got);
        }
        out.close();
        if (!out) throw std::runtime_error("Failed writing block: " + path.string());
    }
    if (in.bad()) throw std::runtime_error("Error reading archive: " + archive.string());

    // Digests come from the files as written, not from the input stream.
    std::vector<ManifestEntry> entries;
    entries.reserve(count);
    for (const auto& name : names) {
        entries.push_back({name, platform::md5_file(out_dir / name)});
    }
    return Manifest(std::move(entries));
}
