#pragma once

#include <string>
#include <vector>
#include <transfer/transfer_job.hpp>

void print_usage();

// Arguments are validated before the config file is read, so a bad command
// line is reported as Usage even when the config is broken.
JobContext build_job_context(const std::vector<std::string>& args);

class NimbusCLI {
public:
    NimbusCLI() = default;

    // Run one transfer from the positional arguments
    // <source> <destination> <block_size_mb> <parallel_jobs>.
    // Prints progress and the failure class; returns the process exit code.
    int run_transfer(const std::vector<std::string>& args);

private:
    void print_summary(const TransferStats& stats) const;
};
