#include "transfer_job.hpp"
#include "archive_packer.hpp"
#include "block_splitter.hpp"
#include "cleanup_guard.hpp"
#include "local_transport.hpp"
#include "preflight.hpp"
#include "reassembler.hpp"
#include "remote_transport.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/interrupt.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>
#include <unistd.h>
#include <iterator>
#include <set>
#include <sstream>

namespace {

// Run a remote command that must succeed; failure becomes a NimbusError of
// the given kind.
SSHResult run_checked(SSHConnection& conn, const std::string& label, const std::string& cmd,
                      ErrorKind kind, const std::string& what) {
    auto r = conn.run(cmd);
    nimbus_log_ssh(label, cmd, r);
    if (r.failed()) {
        std::string detail = strip_cr(r.get_output());
        trim(detail);
        throw NimbusError(kind, what + (detail.empty() ? "" : ": " + detail));
    }
    return r;
}

// Remove blocks in the remote staging dir that the manifest does not list,
// left behind by an earlier run that was killed before its cleanup. They
// would otherwise match the reassembly glob.
void prune_remote_strays(SSHConnection& conn, const std::string& dir,
                         const std::string& prefix, const Manifest& manifest) {
    std::string list_cmd = "cd " + shell_quote(dir) + " && for f in " + shell_quote(prefix) +
                           "*; do [ -e \"$f\" ] && echo \"$f\"; done; true";
    auto r = run_checked(conn, "list-remote", list_cmd, ErrorKind::Endpoint,
                         "Cannot list remote staging directory");

    std::string strays;
    std::istringstream in(strip_cr(r.stdout_data));
    std::string name;
    while (std::getline(in, name)) {
        if (!name.empty() && !manifest.find(name)) strays += " " + shell_quote(name);
    }
    if (strays.empty()) return;

    run_checked(conn, "prune-remote", "cd " + shell_quote(dir) + " && rm -f" + strays,
                ErrorKind::Endpoint, "Cannot remove stale blocks on remote host");
}

} // namespace

TransferJob::TransferJob(JobContext ctx) : ctx_(std::move(ctx)) {
    stage_dir_ = fs::path(expand_home(ctx_.transfer.work_dir)) /
                 fmt::format(".nimbus-{}", static_cast<long>(getpid()));
}

void TransferJob::step(const std::string& msg) const {
    nimbus_log(msg);
    if (ctx_.on_step) ctx_.on_step(msg);
}

void TransferJob::info(const std::string& msg) const {
    nimbus_log(msg);
    if (ctx_.on_info) ctx_.on_info(msg);
}

TransferStats TransferJob::run() {
    step(fmt::format("--- {} Transfer Mode ---", mode_name(ctx_.spec.mode)));
    nimbus_log(fmt::format("job: {} -> {} block={} jobs={} rounds={}",
                           ctx_.spec.source.display(), ctx_.spec.destination.display(),
                           ctx_.spec.block_size, ctx_.spec.parallel_jobs, ctx_.spec.max_rounds));

    switch (ctx_.spec.mode) {
    case TransferMode::LocalToLocal:  return run_local_to_local();
    case TransferMode::LocalToRemote: return run_local_to_remote();
    case TransferMode::RemoteToLocal: return run_remote_to_local();
    }
    throw NimbusError(ErrorKind::Internal, "Unknown transfer mode");
}

// ── Shared phases ────────────────────────────────────────────

std::unique_ptr<SessionManager> TransferJob::open_session() {
    const Endpoint* remote = ctx_.spec.remote();

    SessionTarget target;
    target.host = remote->host;
    target.user = remote->user;
    target.port = ctx_.remote.port;
    target.timeout = ctx_.remote.timeout;
    if (ctx_.remote.ssh_key_path) target.ssh_key_path = expand_home(*ctx_.remote.ssh_key_path);
    target.password = ctx_.remote.password;

    auto session = std::make_unique<SessionManager>(target);
    auto r = session->establish([](const std::string& m) { nimbus_log(m); });
    if (r.failed()) {
        ErrorKind kind = session->failure() == SessionFailure::AuthFailed
                             ? ErrorKind::AuthFailed : ErrorKind::Unreachable;
        throw NimbusError(kind, r.stderr_data);
    }
    return session;
}

CodecInfo TransferJob::negotiate_remote(SSHConnection& conn) const {
    std::vector<std::string> tools(std::begin(REMOTE_BASE_TOOLS), std::end(REMOTE_BASE_TOOLS));
    for (CodecKind kind : codec_candidates(ctx_.transfer.codec)) {
        tools.push_back(codec_info(kind).name);
    }

    auto probe = find_missing_remote_tools(conn, tools);
    if (probe.is_err()) {
        throw NimbusError(ErrorKind::Unreachable, probe.error);
    }
    const auto& missing = probe.value;

    std::string lacking;
    for (const char* t : REMOTE_BASE_TOOLS) {
        if (missing.count(t)) lacking += std::string(lacking.empty() ? "" : ", ") + t;
    }
    if (!lacking.empty()) {
        throw NimbusError(ErrorKind::DependencyMissing, "Remote host lacks: " + lacking);
    }

    return select_codec(ctx_.transfer.codec, local_codec_probe(),
                        [&missing](const std::string& name) { return missing.count(name) == 0; });
}

Manifest TransferJob::stage_local(const CodecInfo& codec, const BlockSplitter& splitter) {
    std::error_code ec;
    fs::create_directories(stage_dir_, ec);
    if (ec) {
        throw NimbusError(ErrorKind::Endpoint,
                          "Cannot create work directory " + stage_dir_.string() + ": " + ec.message());
    }

    fs::path archive = pack_local(ctx_.spec.source.path, stage_dir_, codec);
    check_interrupted();

    Manifest manifest;
    try {
        manifest = splitter.split(archive, stage_dir_);
    } catch (const NimbusError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw NimbusError(ErrorKind::Internal, std::string("Failed to split archive: ") + e.what());
    }
    fs::remove(archive, ec);

    auto saved = manifest.save(stage_dir_ / ctx_.transfer.manifest_name);
    if (saved.is_err()) {
        throw NimbusError(ErrorKind::Internal, saved.error);
    }
    info(fmt::format("Expected chunks: {}", manifest.size()));
    return manifest;
}

TransferReport TransferJob::drive(BlockTransport& transport, const Manifest& manifest) {
    TransferScheduler scheduler(transport, ctx_.spec.parallel_jobs, ctx_.spec.max_rounds,
                                [this](const std::string& m) { info(m); });
    auto report = scheduler.run(manifest);
    info(fmt::format("All {} chunks successfully transferred.", manifest.size()));
    return report;
}

TransferStats TransferJob::finish(const Manifest& manifest, const TransferReport& report) const {
    TransferStats stats;
    stats.blocks = manifest.size();
    stats.bytes = static_cast<uint64_t>(manifest.size()) * ctx_.spec.block_size;
    stats.rounds = report.rounds;
    // Copy time only: reassembly and cleanup are not part of it.
    if (report.first_dispatch && report.completed) {
        std::chrono::duration<double> d = *report.completed - *report.first_dispatch;
        stats.elapsed_secs = d.count();
    }
    if (stats.elapsed_secs > 0) {
        stats.throughput = static_cast<double>(stats.bytes) / stats.elapsed_secs;
    }
    nimbus_log(fmt::format("done: {} blocks, {} in {:.2f}s", stats.blocks,
                           format_bytes(stats.bytes), stats.elapsed_secs));
    return stats;
}

// ── Local -> Local ───────────────────────────────────────────

TransferStats TransferJob::run_local_to_local() {
    const auto& spec = ctx_.spec;
    fs::path dest = spec.destination.path;

    check_local_source(spec.source.path);
    require_clean(check_local_dependencies());
    CodecInfo codec = select_codec(ctx_.transfer.codec, local_codec_probe(), nullptr);

    CleanupGuard cleanup;
    cleanup.add_local_dir(stage_dir_);

    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        throw NimbusError(ErrorKind::Endpoint, "Cannot create destination " + dest.string() +
                                               ": " + ec.message());
    }

    BlockSplitter splitter(ctx_.transfer.chunk_prefix, spec.block_size);
    step("1. Creating and splitting archive locally...");
    Manifest manifest = stage_local(codec, splitter);
    cleanup.add_local_files(dest, manifest.names());

    step(fmt::format("2. Transferring chunks to destination (parallel={})...", spec.parallel_jobs));
    LocalTransport transport(stage_dir_, dest);
    auto report = drive(transport, manifest);

    check_interrupted();
    step("3. Reassembling archive in destination...");
    reassemble_local(manifest, dest, dest);

    step("4. Cleaning up...");
    cleanup.run();
    return finish(manifest, report);
}

// ── Local -> Remote ──────────────────────────────────────────

TransferStats TransferJob::run_local_to_remote() {
    const auto& spec = ctx_.spec;
    const auto& tmp = ctx_.remote.tmp_dir;
    const auto& prefix = ctx_.transfer.chunk_prefix;
    const auto& manifest_name = ctx_.transfer.manifest_name;

    // Everything local is settled before the first packet goes out.
    check_local_source(spec.source.path);
    require_clean(check_local_dependencies());
    info("Destination is Remote: " + spec.destination.credential_target());

    auto session = open_session();
    SSHConnection conn(session->get_raw_session(), session->io_mutex(), session->get_socket(),
                       session->setup_mutex());
    CleanupGuard cleanup;
    cleanup.add_local_dir(stage_dir_);

    CodecInfo codec = negotiate_remote(conn);
    BlockSplitter splitter(prefix, spec.block_size);

    step("1. Creating and splitting archive locally...");
    Manifest manifest = stage_local(codec, splitter);

    check_interrupted();
    step(fmt::format("2. Preparing remote host ({})...", spec.destination.credential_target()));
    cleanup.set_remote(&conn, tmp);
    run_checked(conn, "prepare-remote",
                "mkdir -p " + shell_quote(tmp) + " && mkdir -p " + shell_quote(spec.destination.path),
                ErrorKind::Endpoint, "Failed to prepare remote directories");
    prune_remote_strays(conn, tmp, prefix, manifest);

    auto up = conn.upload(stage_dir_ / manifest_name, tmp + "/" + manifest_name);
    if (up.failed()) {
        throw NimbusError(ErrorKind::Unreachable, "Failed to upload manifest: " + up.stderr_data);
    }

    step(fmt::format("3. Transferring chunks to remote host (parallel={})...", spec.parallel_jobs));
    UploadTransport transport(conn, stage_dir_, tmp, manifest_name);
    auto report = drive(transport, manifest);

    check_interrupted();
    step("4. Reassembling archive on remote host...");
    reassemble_remote(conn, tmp, prefix, codec, spec.destination.path);

    step("5. Cleaning up...");
    cleanup.run();
    return finish(manifest, report);
}

// ── Remote -> Local ──────────────────────────────────────────

TransferStats TransferJob::run_remote_to_local() {
    const auto& spec = ctx_.spec;
    const auto& tmp = ctx_.remote.tmp_dir;
    const auto& prefix = ctx_.transfer.chunk_prefix;
    const auto& manifest_name = ctx_.transfer.manifest_name;
    fs::path dest = spec.destination.path;

    require_clean(check_local_dependencies());
    info("Source is Remote: " + spec.source.credential_target());

    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        throw NimbusError(ErrorKind::Endpoint, "Cannot create destination " + dest.string() +
                                               ": " + ec.message());
    }

    auto session = open_session();
    SSHConnection conn(session->get_raw_session(), session->io_mutex(), session->get_socket(),
                       session->setup_mutex());
    CleanupGuard cleanup;
    cleanup.add_local_dir(stage_dir_);
    fs::create_directories(stage_dir_, ec);
    if (ec) {
        throw NimbusError(ErrorKind::Endpoint, "Cannot create work directory " +
                                               stage_dir_.string() + ": " + ec.message());
    }

    CodecInfo codec = negotiate_remote(conn);
    BlockSplitter splitter(prefix, spec.block_size);

    step(fmt::format("1. Preparing remote host ({})...", spec.source.credential_target()));
    check_remote_source(conn, spec.source.path);
    cleanup.set_remote(&conn, tmp);
    // The source side is rebuilt every run, so nothing old may survive here.
    run_checked(conn, "prepare-remote",
                "mkdir -p " + shell_quote(tmp) + " && rm -f " + shell_quote(tmp) + "/" +
                shell_quote(prefix) + "* " + shell_quote(tmp) + "/" + TMP_ARCHIVE_BASE + "*",
                ErrorKind::Endpoint, "Failed to prepare remote staging directory");

    check_interrupted();
    step("2. Creating and splitting archive on remote host...");
    std::string archive = pack_remote(conn, spec.source.path, tmp, codec);

    auto size_r = run_checked(conn, "stat-archive", "stat -c %s " + shell_quote(archive),
                              ErrorKind::Endpoint, "Cannot stat remote archive");
    std::string size_str = strip_cr(size_r.stdout_data);
    trim(size_str);
    auto size = parse_u64(size_str);
    if (!size) {
        throw NimbusError(ErrorKind::Endpoint, "Unexpected archive size from remote: " + size_str);
    }
    size_t expected = splitter.block_count(*size);
    splitter.check_capacity(expected);

    std::string split_cmd = "cd " + shell_quote(tmp) + " && ";
    if (*size == 0) {
        split_cmd += ": > " + shell_quote(splitter.block_name(0));
    } else {
        split_cmd += fmt::format("split -b {} -d -a {} {} {}", spec.block_size, BLOCK_INDEX_WIDTH,
                                 shell_quote(archive), shell_quote(prefix));
    }
    split_cmd += " && rm -f " + shell_quote(archive) +
                 " && LC_ALL=C md5sum " + shell_quote(prefix) + "* > " + shell_quote(manifest_name);
    run_checked(conn, "split-remote", split_cmd, ErrorKind::Endpoint,
                "Failed to split archive on remote host");

    fs::path local_manifest = stage_dir_ / manifest_name;
    auto down = conn.download(tmp + "/" + manifest_name, local_manifest);
    if (down.failed()) {
        throw NimbusError(ErrorKind::Unreachable, "Failed to fetch manifest: " + down.stderr_data);
    }
    auto loaded = Manifest::load(local_manifest);
    if (loaded.is_err()) {
        throw NimbusError(ErrorKind::Endpoint, loaded.error);
    }
    Manifest manifest = std::move(loaded.value);
    if (manifest.names() != splitter.block_names(expected)) {
        throw NimbusError(ErrorKind::Endpoint,
            fmt::format("Remote split produced {} chunks, expected {}", manifest.size(), expected));
    }
    info(fmt::format("Expected chunks: {}", manifest.size()));
    cleanup.add_local_files(dest, manifest.names());

    step(fmt::format("3. Transferring chunks to local destination (parallel={})...",
                     spec.parallel_jobs));
    DownloadTransport transport(conn, tmp, dest);
    auto report = drive(transport, manifest);

    check_interrupted();
    step("4. Reassembling archive locally in destination...");
    reassemble_local(manifest, dest, dest);

    step("5. Cleaning up...");
    cleanup.run();
    return finish(manifest, report);
}
