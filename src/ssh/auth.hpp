#pragma once

#include <string>
#include <optional>
#include <vector>
#include <core/types.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    std::string user;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
    std::string password;       // empty: prompt on the terminal if needed
};

// Private key files tried when no agent identity is accepted: the configured
// key first, then the usual defaults under ~/.ssh that exist and are readable.
std::vector<std::string> candidate_key_files(const SessionTarget& target);

// Authenticate a freshly handshaken session. The session must be in
// blocking mode. Methods are tried in order:
//   ssh-agent -> key files -> password -> keyboard-interactive
// A password is taken from the target, or read from the terminal once when
// stdin is a tty. Returns exit_code 0 on success.
SSHResult authenticate(LIBSSH2_SESSION* session, const SessionTarget& target,
                       StatusCallback callback = nullptr);
