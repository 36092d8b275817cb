#pragma once

#include <functional>
#include <string>
#include <vector>
#include <platform/archive.hpp>

enum class CodecKind {
    Zstd,
    Gzip,
};

// How one compression format is produced and undone on each side.
struct CodecInfo {
    CodecKind kind;
    std::string name;               // program name, also probed remotely
    std::string extension;          // appended to archive.tar
    std::string compress_file_cmd;  // remote: replace FILE with FILE+extension
    std::string decompress_cmd;     // remote: stdin -> stdout
    platform::ArchiveFilter filter; // local libarchive filter
};

const CodecInfo& codec_info(CodecKind kind);

// Answers "can this side handle codec <name>?".
using CodecProbe = std::function<bool(const std::string& name)>;

// Probe backed by the local libarchive build.
CodecProbe local_codec_probe();

// Candidate codecs for a configured preference ("auto", "zstd", "gzip"),
// in order of preference.
std::vector<CodecKind> codec_candidates(const std::string& preference);

// Pick the first candidate both sides can handle. remote_ok may be empty for
// jobs with no remote side. Throws NimbusError(DependencyMissing) if none fits.
CodecInfo select_codec(const std::string& preference,
                       const CodecProbe& local_ok,
                       const CodecProbe& remote_ok);
