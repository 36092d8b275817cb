#include "remote_transport.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>
#include <sstream>

std::set<std::string> parse_md5sum_check(const std::string& output) {
    static const std::string OK_SUFFIX = ": OK";
    std::set<std::string> ok;
    std::istringstream in(strip_cr(output));
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() > OK_SUFFIX.size() &&
            line.compare(line.size() - OK_SUFFIX.size(), OK_SUFFIX.size(), OK_SUFFIX) == 0) {
            ok.insert(line.substr(0, line.size() - OK_SUFFIX.size()));
        }
    }
    return ok;
}

// ── UploadTransport ──────────────────────────────────────────

UploadTransport::UploadTransport(SSHConnection& conn, fs::path local_dir,
                                 std::string remote_dir, std::string manifest_name)
    : conn_(conn), local_dir_(std::move(local_dir)), remote_dir_(std::move(remote_dir)),
      manifest_name_(std::move(manifest_name)) {
}

std::vector<std::string> UploadTransport::find_invalid(const Manifest& manifest) {
    // md5sum exits 1 whenever any block is missing or bad; only the per-line
    // verdicts matter. Anything not reported OK is pending.
    std::string cmd = "cd " + shell_quote(remote_dir_) + " && LC_ALL=C md5sum -c " +
                      shell_quote(manifest_name_) + " 2>/dev/null";
    auto r = conn_.run(cmd);
    nimbus_log_ssh("verify-remote", cmd, r);

    auto ok = parse_md5sum_check(r.stdout_data);
    std::vector<std::string> invalid;
    for (const auto& e : manifest.entries()) {
        if (!ok.count(e.name)) invalid.push_back(e.name);
    }
    return invalid;
}

Result<void> UploadTransport::copy_block(const std::string& name) {
    auto r = conn_.upload(local_dir_ / name, remote_dir_ + "/" + name);
    if (r.failed()) {
        return Result<void>::Err("upload " + name + ": " + r.stderr_data);
    }
    return Result<void>::Ok();
}

// ── DownloadTransport ────────────────────────────────────────

DownloadTransport::DownloadTransport(SSHConnection& conn, std::string remote_dir,
                                     fs::path local_dir)
    : conn_(conn), remote_dir_(std::move(remote_dir)), local_dir_(std::move(local_dir)) {
}

std::vector<std::string> DownloadTransport::find_invalid(const Manifest& manifest) {
    return verify_local_blocks(manifest, local_dir_);
}

Result<void> DownloadTransport::copy_block(const std::string& name) {
    auto r = conn_.download(remote_dir_ + "/" + name, local_dir_ / name);
    if (r.failed()) {
        return Result<void>::Err("download " + name + ": " + r.stderr_data);
    }
    return Result<void>::Ok();
}
