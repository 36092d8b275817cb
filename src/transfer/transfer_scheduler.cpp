#include "transfer_scheduler.hpp"
#include "worker_pool.hpp"
#include <core/errors.hpp>
#include <core/interrupt.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

TransferScheduler::TransferScheduler(BlockTransport& transport, size_t parallel_jobs,
                                     int max_rounds, StatusCallback callback)
    : transport_(transport), parallel_jobs_(parallel_jobs), max_rounds_(max_rounds),
      callback_(std::move(callback)) {
}

std::vector<std::string> TransferScheduler::compute_pending(const Manifest& manifest) {
    return transport_.find_invalid(manifest);
}

TransferReport TransferScheduler::run(const Manifest& manifest) {
    TransferReport report;
    WorkerPool pool(parallel_jobs_);

    for (int round = 0;; ++round) {
        check_interrupted();

        auto pending = compute_pending(manifest);
        nimbus_log(fmt::format("round {}: {} of {} blocks pending", round,
                               pending.size(), manifest.size()));
        if (pending.empty()) {
            report.rounds = round;
            report.completed = std::chrono::steady_clock::now();
            return report;
        }

        if (round == max_rounds_) {
            throw NimbusError(ErrorKind::TransferIncomplete,
                fmt::format("Failed to transfer all chunks after {} retries. Missing {} chunks.",
                            max_rounds_, pending.size()),
                pending.size());
        }

        if (callback_) {
            callback_(fmt::format("Transfer attempt #{}. Missing: {}", round + 1, pending.size()));
        }
        if (!report.first_dispatch) {
            report.first_dispatch = std::chrono::steady_clock::now();
        }

        report.copies_dispatched += pool.run(pending, [this](const std::string& name) {
            auto r = transport_.copy_block(name);
            if (r.is_err()) nimbus_log("copy failed: " + r.error);
        });
    }
}
