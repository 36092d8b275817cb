#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct TransferSettings {
    int max_retries = 5;
    std::string chunk_prefix = "archive.part.";
    std::string manifest_name = "archive.manifest";
    std::string work_dir = ".";
    std::string codec = "auto";        // auto | zstd | gzip
};

struct RemoteSettings {
    std::string tmp_dir = "/tmp/chunk_transfer";
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
    std::string password;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
