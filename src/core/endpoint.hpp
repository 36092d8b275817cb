#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// One side of a transfer: a local path, or user@host:path on a remote host.
struct Endpoint {
    std::string path;
    std::string user;   // empty for local endpoints
    std::string host;   // empty for local endpoints

    bool is_remote() const { return !host.empty(); }

    // "user@host", what the session authenticates against.
    std::string credential_target() const;

    // How the endpoint was written on the command line.
    std::string display() const;
};

enum class TransferMode {
    LocalToLocal,
    LocalToRemote,
    RemoteToLocal,
};

const char* mode_name(TransferMode mode);

// A validated transfer request. Immutable once built.
struct JobSpec {
    Endpoint source;
    Endpoint destination;
    uint64_t block_size = 0;    // bytes
    size_t parallel_jobs = 1;
    int max_rounds = 5;
    TransferMode mode = TransferMode::LocalToLocal;

    // The single remote side, if any.
    const Endpoint* remote() const;
};

// Parse "user@host:/path" or a plain local path.
Endpoint parse_endpoint(const std::string& arg);

// Build a JobSpec from the four positional arguments
// <source> <destination> <block_size_mb> <parallel_jobs>.
// Throws NimbusError(Usage) for malformed arguments and
// NimbusError(Endpoint) when both endpoints are remote.
JobSpec parse_job_args(const std::vector<std::string>& args, int max_rounds);
