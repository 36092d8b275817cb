#include "reassembler.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/archive.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>

void reassemble_local(const Manifest& manifest, const fs::path& block_dir,
                      const fs::path& dest_dir) {
    std::vector<fs::path> parts;
    parts.reserve(manifest.size());
    for (const auto& e : manifest.entries()) {
        parts.push_back(block_dir / e.name);
    }

    try {
        size_t n = platform::extract_tar(parts, dest_dir, true);
        nimbus_log(fmt::format("Extracted {} entries into {}", n, dest_dir.string()));
    } catch (const std::runtime_error& e) {
        throw NimbusError(ErrorKind::Reassembly, std::string("Failed to unpack archive: ") + e.what());
    }
}

void reassemble_remote(SSHConnection& conn, const std::string& block_dir,
                       const std::string& prefix, const CodecInfo& codec,
                       const std::string& dest_dir) {
    // The prefix never contains '/', and its glob expands in index order
    // because the index is fixed width.
    std::string cmd = "cd " + shell_quote(block_dir) + " && LC_ALL=C cat " +
                      shell_quote(prefix) + "* | " + codec.decompress_cmd +
                      " | tar -xf - -C " + shell_quote(dest_dir);
    auto r = conn.run(cmd, SSH_CMD_TIMEOUT_SECS * 12);
    nimbus_log_ssh("reassemble-remote", cmd, r);
    if (r.failed()) {
        throw NimbusError(ErrorKind::Reassembly,
                          "Failed to unpack archive on remote host: " +
                          strip_cr(r.get_output()));
    }
}
