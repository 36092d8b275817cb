#include "endpoint.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <limits>
#include <regex>

std::string Endpoint::credential_target() const {
    if (!is_remote()) return "";
    return user + "@" + host;
}

std::string Endpoint::display() const {
    if (!is_remote()) return path;
    return credential_target() + ":" + path;
}

const char* mode_name(TransferMode mode) {
    switch (mode) {
    case TransferMode::LocalToLocal:  return "Local-to-Local";
    case TransferMode::LocalToRemote: return "Local-to-Remote";
    case TransferMode::RemoteToLocal: return "Remote-to-Local";
    }
    return "Local-to-Local";
}

const Endpoint* JobSpec::remote() const {
    if (source.is_remote()) return &source;
    if (destination.is_remote()) return &destination;
    return nullptr;
}

Endpoint parse_endpoint(const std::string& arg) {
    static const std::regex remote_pattern("^([^@]+)@([^:]+):(.+)$");

    Endpoint ep;
    std::smatch m;
    if (std::regex_match(arg, m, remote_pattern)) {
        ep.user = m[1].str();
        ep.host = m[2].str();
        ep.path = m[3].str();
    } else {
        ep.path = arg;
    }
    return ep;
}

JobSpec parse_job_args(const std::vector<std::string>& args, int max_rounds) {
    if (args.size() != 4) {
        throw NimbusError(ErrorKind::Usage, fmt::format(
            "Expected 4 arguments, got {}", args.size()));
    }

    JobSpec spec;
    spec.source = parse_endpoint(args[0]);
    spec.destination = parse_endpoint(args[1]);
    spec.max_rounds = max_rounds;

    if (spec.source.path.empty() || spec.destination.path.empty()) {
        throw NimbusError(ErrorKind::Usage, "Source and destination paths must not be empty");
    }

    auto block_mb = parse_u64(args[2]);
    if (!block_mb || *block_mb == 0) {
        throw NimbusError(ErrorKind::Usage, fmt::format(
            "Block size must be a positive whole number of megabytes, got '{}'", args[2]));
    }
    if (*block_mb > std::numeric_limits<uint64_t>::max() / BYTES_PER_MB) {
        throw NimbusError(ErrorKind::Usage, fmt::format("Block size too large: {} MB", *block_mb));
    }
    spec.block_size = *block_mb * BYTES_PER_MB;

    auto jobs = parse_u64(args[3]);
    if (!jobs || *jobs == 0 || *jobs > 1024) {
        throw NimbusError(ErrorKind::Usage, fmt::format(
            "Parallel jobs must be a whole number between 1 and 1024, got '{}'", args[3]));
    }
    spec.parallel_jobs = static_cast<size_t>(*jobs);

    if (spec.source.is_remote() && spec.destination.is_remote()) {
        throw NimbusError(ErrorKind::Endpoint,
            "Transfer between two remote hosts is not supported");
    }

    if (spec.source.is_remote()) {
        spec.mode = TransferMode::RemoteToLocal;
    } else if (spec.destination.is_remote()) {
        spec.mode = TransferMode::LocalToRemote;
    } else {
        spec.mode = TransferMode::LocalToLocal;
    }

    return spec;
}
