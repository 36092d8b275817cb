#include "archive_packer.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/connection.hpp>

void check_local_source(const fs::path& path) {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (ec || !fs::exists(st)) {
        throw NimbusError(ErrorKind::Endpoint, "Source not found: " + path.string());
    }
    if (!platform::is_readable(path)) {
        throw NimbusError(ErrorKind::Endpoint, "Source not readable: " + path.string());
    }
}

fs::path pack_local(const fs::path& source, const fs::path& stage_dir, const CodecInfo& codec) {
    fs::path archive = stage_dir / (std::string(TMP_ARCHIVE_BASE) + codec.extension);
    try {
        platform::create_tar(archive, source, codec.filter, {stage_dir});
    } catch (const std::runtime_error& e) {
        throw NimbusError(ErrorKind::Endpoint, std::string("Failed to archive source: ") + e.what());
    }
    nimbus_log("Packed " + source.string() + " -> " + archive.string() +
               " (" + format_bytes(fs::file_size(archive)) + ")");
    return archive;
}

std::pair<std::string, std::string> split_remote_path(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    if (p.empty() || p == "/") {
        throw NimbusError(ErrorKind::Endpoint, "Cannot transfer the filesystem root");
    }

    auto slash = p.rfind('/');
    if (slash == std::string::npos) return {".", p};
    if (slash == 0) return {"/", p.substr(1)};
    return {p.substr(0, slash), p.substr(slash + 1)};
}

void check_remote_source(SSHConnection& conn, const std::string& path) {
    std::string q = shell_quote(path);
    std::string cmd = "test -e " + q + " || test -L " + q;
    auto r = conn.run(cmd);
    nimbus_log_ssh("source-check", cmd, r);
    if (r.exit_code < 0) {
        throw NimbusError(ErrorKind::Unreachable, "Remote command failed: " + r.stderr_data);
    }
    if (r.failed()) {
        throw NimbusError(ErrorKind::Endpoint, "Remote source not found: " + path);
    }

    cmd = "test -r " + q;
    r = conn.run(cmd);
    nimbus_log_ssh("source-check", cmd, r);
    if (r.failed()) {
        throw NimbusError(ErrorKind::Endpoint, "Remote source not readable: " + path);
    }
}

std::string pack_remote(SSHConnection& conn, const std::string& source,
                        const std::string& tmp_dir, const CodecInfo& codec) {
    auto [parent, base] = split_remote_path(source);
    std::string tar_path = tmp_dir + "/" + TMP_ARCHIVE_BASE;
    std::string archive = tar_path + codec.extension;

    std::string cmd = "tar -C " + shell_quote(parent) + " -cf " + shell_quote(tar_path) +
                      " " + shell_quote(base) +
                      " && " + codec.compress_file_cmd + " " + shell_quote(tar_path);
    auto r = conn.run(cmd, SSH_CMD_TIMEOUT_SECS * 12);
    nimbus_log_ssh("pack-remote", cmd, r);
    if (r.failed()) {
        throw NimbusError(ErrorKind::Endpoint,
                          "Failed to archive remote source: " + strip_cr(r.get_output()));
    }
    return archive;
}
