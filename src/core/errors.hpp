#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

// Failure classes a job can end with. Each maps to its own exit code so the
// cause stays visible to scripts as well as in the printed message.
enum class ErrorKind {
    Usage,
    Config,
    DependencyMissing,
    Endpoint,
    AuthFailed,
    Unreachable,
    TransferIncomplete,
    Reassembly,
    Interrupted,
    Internal,
};

class NimbusError : public std::runtime_error {
public:
    NimbusError(ErrorKind kind, const std::string& message, size_t missing_blocks = 0);

    ErrorKind kind() const { return kind_; }

    // Only meaningful for TransferIncomplete.
    size_t missing_blocks() const { return missing_blocks_; }

private:
    ErrorKind kind_;
    size_t missing_blocks_;
};

const char* error_kind_name(ErrorKind kind);
int exit_code_for(ErrorKind kind);
