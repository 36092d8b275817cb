#include "cleanup_guard.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection.hpp>

CleanupGuard::~CleanupGuard() {
    run();
}

void CleanupGuard::add_local_dir(const fs::path& dir) {
    local_dirs_.push_back(dir);
}

void CleanupGuard::add_local_files(const fs::path& dir, const std::vector<std::string>& names) {
    for (const auto& n : names) local_files_.push_back(dir / n);
}

void CleanupGuard::set_remote(SSHConnection* conn, const std::string& remote_dir) {
    conn_ = conn;
    remote_dir_ = remote_dir;
}

void CleanupGuard::run() {
    if (done_) return;
    done_ = true;

    std::error_code ec;
    for (const auto& f : local_files_) {
        fs::remove(f, ec);
        if (ec) nimbus_log("cleanup: cannot remove " + f.string() + ": " + ec.message());
    }
    for (const auto& d : local_dirs_) {
        fs::remove_all(d, ec);
        if (ec) nimbus_log("cleanup: cannot remove " + d.string() + ": " + ec.message());
    }

    if (conn_ && !remote_dir_.empty()) {
        std::string cmd = "rm -rf " + shell_quote(remote_dir_);
        auto r = conn_->run(cmd);
        nimbus_log_ssh("cleanup", cmd, r);
    }
}
