#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <core/endpoint.hpp>
#include <core/types.hpp>
#include "codec.hpp"
#include "manifest.hpp"
#include "transfer_scheduler.hpp"

namespace fs = std::filesystem;

class SessionManager;
class SSHConnection;
class BlockSplitter;

// Everything one job needs, fixed before it starts.
struct JobContext {
    JobSpec spec;
    TransferSettings transfer;
    RemoteSettings remote;
    StatusCallback on_step;     // mode banner and numbered phases
    StatusCallback on_info;     // detail lines (chunk counts, attempts)
};

struct TransferStats {
    size_t blocks = 0;
    uint64_t bytes = 0;         // blocks x block size
    double elapsed_secs = 0;    // from the first copy dispatch
    double throughput = 0;      // bytes per second
    int rounds = 0;
};

// One transfer from source to destination: pack, split, drive blocks across,
// reassemble, clean up. Every failure surfaces as a NimbusError after the
// job's temporary artifacts and the session have been released.
class TransferJob {
public:
    explicit TransferJob(JobContext ctx);

    TransferStats run();

private:
    JobContext ctx_;
    fs::path stage_dir_;

    TransferStats run_local_to_local();
    TransferStats run_local_to_remote();
    TransferStats run_remote_to_local();

    void step(const std::string& msg) const;
    void info(const std::string& msg) const;

    std::unique_ptr<SessionManager> open_session();
    CodecInfo negotiate_remote(SSHConnection& conn) const;

    Manifest stage_local(const CodecInfo& codec, const BlockSplitter& splitter);
    TransferReport drive(BlockTransport& transport, const Manifest& manifest);
    TransferStats finish(const Manifest& manifest, const TransferReport& report) const;
};
