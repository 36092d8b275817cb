#include "nimbus_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/endpoint.hpp>
#include <core/errors.hpp>
#include <core/interrupt.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <iostream>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    nimbus "
              << theme::color::RESET << theme::color::BROWN
              << "<source> <destination> <block_size_mb> <parallel_jobs>"
              << theme::color::RESET << "\n\n";
    std::cout << theme::color::DIM
              << "    Either path may be remote, written as user@host:/path\n"
              << "    (but not both). Settings are read from "
              << get_global_config_path().string() << " if present."
              << theme::color::RESET << "\n\n";
    std::cout << theme::color::DIM
              << "    nimbus --version      Show version\n"
              << "    nimbus --help         Show this help"
              << theme::color::RESET << "\n\n";
}

JobContext build_job_context(const std::vector<std::string>& args) {
    JobContext ctx;
    ctx.spec = parse_job_args(args, DEFAULT_MAX_RETRIES);

    auto config = Config::load_global();
    if (config.is_err()) {
        throw NimbusError(ErrorKind::Config, config.error);
    }
    const auto& cfg = config.value;
    ctx.spec.max_rounds = cfg.transfer().max_retries;
    ctx.transfer = cfg.transfer();
    ctx.remote = cfg.remote();
    return ctx;
}

int NimbusCLI::run_transfer(const std::vector<std::string>& args) {
    install_signal_handler();

    try {
        JobContext ctx = build_job_context(args);
        ctx.on_step = [](const std::string& msg) { std::cout << theme::step(msg) << std::flush; };
        ctx.on_info = [](const std::string& msg) { std::cout << theme::info(msg) << std::flush; };

        TransferJob job(std::move(ctx));
        auto stats = job.run();

        std::cout << theme::ok("Done.");
        print_summary(stats);
        return 0;

    } catch (const NimbusError& e) {
        nimbus_log(fmt::format("FAILED [{}] {}", error_kind_name(e.kind()), e.what()));
        std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(e.kind()), e.what()));
        if (e.kind() == ErrorKind::Usage) {
            std::cout << theme::step(
                "Usage: nimbus <source_path> <destination_path> <block_size_mb> <parallel_jobs>");
        }
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        nimbus_log(std::string("FAILED [internal] ") + e.what());
        std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(ErrorKind::Internal), e.what()));
        return exit_code_for(ErrorKind::Internal);
    }
}

void NimbusCLI::print_summary(const TransferStats& stats) const {
    std::cout << theme::section("Summary");
    std::cout << theme::kv("Chunks", std::to_string(stats.blocks));
    std::cout << theme::kv("Moved", format_bytes(stats.bytes));
    std::cout << theme::kv("Elapsed", fmt::format("{:.1f}s", stats.elapsed_secs));
    std::cout << theme::kv("Speed", stats.throughput > 0
                                        ? format_bytes(static_cast<uint64_t>(stats.throughput)) + "/s"
                                        : "-");
    std::cout << theme::kv("Rounds", std::to_string(stats.rounds));
    std::cout << "\n";
}
