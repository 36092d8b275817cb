#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class SSHConnection;

// Removes a job's temporary artifacts when it goes out of scope, on success
// and failure alike. Every removal is best effort: failures are logged and
// never thrown. Declare it after the session it uses so it runs first.
class CleanupGuard {
public:
    CleanupGuard() = default;
    ~CleanupGuard();

    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

    void add_local_dir(const fs::path& dir);
    void add_local_files(const fs::path& dir, const std::vector<std::string>& names);
    void set_remote(SSHConnection* conn, const std::string& remote_dir);

    // Idempotent; the destructor calls it too.
    void run();

private:
    std::vector<fs::path> local_dirs_;
    std::vector<fs::path> local_files_;
    SSHConnection* conn_ = nullptr;
    std::string remote_dir_;
    bool done_ = false;
};
