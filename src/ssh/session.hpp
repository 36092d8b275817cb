#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "auth.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Why establish() failed, so callers can map it to the right exit status.
enum class SessionFailure {
    None,
    Unreachable,    // resolve, connect or handshake
    AuthFailed,
};

// One authenticated SSH session shared by every remote operation of a job.
// Handshake and auth run in blocking mode; afterwards the session is switched
// to non-blocking so several channels can be driven from worker threads.
// Every libssh2 call on the session must hold io_mutex().
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    SessionFailure failure() const { return failure_; }

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    int get_socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

    // Held across a whole channel setup (open, SCP send/receive) including
    // its EAGAIN retries: libssh2 keeps that pending state in the session.
    std::shared_ptr<std::mutex> setup_mutex() { return setup_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    bool lib_initialized_;
    SessionFailure failure_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::shared_ptr<std::mutex> setup_mutex_;

    SSHResult fail(SessionFailure kind, const std::string& message);
};
