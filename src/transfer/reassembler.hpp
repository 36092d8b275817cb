#pragma once

#include <filesystem>
#include <string>
#include "codec.hpp"
#include "manifest.hpp"

namespace fs = std::filesystem;

class SSHConnection;

// Stream the blocks in block_dir, in manifest order, through the local
// archive reader and unpack into dest_dir. Each block is deleted once it has
// been read. Any failure is a NimbusError(Reassembly).
void reassemble_local(const Manifest& manifest, const fs::path& block_dir,
                      const fs::path& dest_dir);

// On the remote host: cat the blocks in C-locale glob order through the
// decompressor into tar, unpacking into dest_dir.
// Any failure is a NimbusError(Reassembly).
void reassemble_remote(SSHConnection& conn, const std::string& block_dir,
                       const std::string& prefix, const CodecInfo& codec,
                       const std::string& dest_dir);
