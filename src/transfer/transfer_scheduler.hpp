#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "block_transport.hpp"
#include "manifest.hpp"

struct TransferReport {
    int rounds = 0;                 // dispatch rounds actually run
    size_t copies_dispatched = 0;
    std::optional<std::chrono::steady_clock::time_point> first_dispatch;
    std::optional<std::chrono::steady_clock::time_point> completed;    // set once verified
};

// Drives blocks to the destination until it holds every manifest entry
// intact. Each round recomputes the invalid set from the destination and
// dispatches copies for exactly that set; copy outcomes are only logged, the
// next verification decides. After max_rounds dispatch rounds a final
// verification runs, and any block still invalid fails the job with
// NimbusError(TransferIncomplete).
class TransferScheduler {
public:
    TransferScheduler(BlockTransport& transport, size_t parallel_jobs, int max_rounds,
                      StatusCallback callback = nullptr);

    std::vector<std::string> compute_pending(const Manifest& manifest);

    TransferReport run(const Manifest& manifest);

private:
    BlockTransport& transport_;
    size_t parallel_jobs_;
    int max_rounds_;
    StatusCallback callback_;
};
