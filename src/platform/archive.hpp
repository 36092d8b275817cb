#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace platform {

// Compression filters the local libarchive can apply to a tar stream.
enum class ArchiveFilter {
    Zstd,
    Gzip,
};

// True if libarchive can both write and read the filter natively
// (no fallback to an external program).
bool filter_supported(ArchiveFilter filter);

// True if libarchive can write and read plain tar streams at all.
bool tar_supported();

// Create a compressed tar archive at tar_path holding the file or directory
// tree at source. Entries are rooted at source's basename, so extracting
// into D recreates D/<basename>/... Directories, regular files and symlinks
// are stored with their permissions and mtimes; symlinks are not followed.
// The archive file itself and anything under `exclude` are left out, so the
// output may live inside the tree being packed.
// Throws std::runtime_error if anything under source cannot be read.
void create_tar(const std::filesystem::path& tar_path,
                const std::filesystem::path& source,
                ArchiveFilter filter,
                const std::vector<std::filesystem::path>& exclude = {});

// Extract the archive formed by concatenating parts in the given order into
// dest_dir. The compression filter is detected from the stream. The parts
// are read one after another without materializing the joined stream; with
// consume_parts each part is deleted once fully read.
// Throws std::runtime_error on an unreadable part or a malformed stream.
// Returns the number of entries extracted.
size_t extract_tar(const std::vector<std::filesystem::path>& parts,
                   const std::filesystem::path& dest_dir,
                   bool consume_parts);

} // namespace platform
