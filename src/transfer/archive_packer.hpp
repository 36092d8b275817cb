#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include "codec.hpp"

namespace fs = std::filesystem;

class SSHConnection;

// Fails with NimbusError(Endpoint) unless path exists and can be read.
void check_local_source(const fs::path& path);

// Pack a local file or tree into <stage_dir>/archive.tar<ext>. stage_dir is
// left out of the archive when it lies inside source.
// Returns the archive path. Unreadable content is an Endpoint error.
fs::path pack_local(const fs::path& source, const fs::path& stage_dir, const CodecInfo& codec);

// Split a POSIX path into (parent, basename) the way `tar -C parent base`
// wants it. Trailing slashes are ignored. Throws Endpoint for "/".
std::pair<std::string, std::string> split_remote_path(const std::string& path);

// Check the remote source exists and is readable (Endpoint error otherwise).
void check_remote_source(SSHConnection& conn, const std::string& path);

// Pack a remote file or tree into <tmp_dir>/archive.tar<ext> on the remote
// host. Returns the remote archive path.
std::string pack_remote(SSHConnection& conn, const std::string& source,
                        const std::string& tmp_dir, const CodecInfo& codec);
