#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <core/types.hpp>

namespace fs = std::filesystem;

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Remote operations over an established, non-blocking session. Each call
// opens its own channel, so calls from several threads run concurrently;
// the shared io mutex serializes the individual libssh2 calls.
class SSHConnection {
public:
    // setup_mutex must be shared by every connection on the same session;
    // a null one gives this connection its own.
    SSHConnection(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex, int sock,
                  std::shared_ptr<std::mutex> setup_mutex = nullptr);

    virtual ~SSHConnection() = default;

    // Run a shell command on an exec channel. stdout and stderr are collected
    // separately; exit_code is the remote exit status, or -1 if the command
    // could not be run or timed out (timeout_secs 0 = SSH_CMD_TIMEOUT_SECS).
    virtual SSHResult run(const std::string& command, int timeout_secs = 0);

    // Copy one file each way over SCP. The remote side is overwritten.
    virtual SSHResult upload(const fs::path& local, const std::string& remote);
    virtual SSHResult download(const std::string& remote, const fs::path& local);

protected:
    using Clock = std::chrono::steady_clock;

    LIBSSH2_SESSION* session_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::shared_ptr<std::mutex> setup_mutex_;
    int sock_;

    // Drive one channel setup (label names the request in logs) until it
    // yields a channel or a hard error. Only one setup runs per session at a
    // time; a pending non-blocking open lives in the session, and a second
    // request made while it waits on EAGAIN would resume the first one.
    LIBSSH2_CHANNEL* open_call(const std::function<LIBSSH2_CHANNEL*()>& op,
                               const std::string& label, Clock::time_point deadline,
                               std::string& err);

    // One attempt of a setup under the io mutex. Sets again on EAGAIN;
    // otherwise a null return carries the session's error text in err.
    virtual LIBSSH2_CHANNEL* open_step(const std::function<LIBSSH2_CHANNEL*()>& op,
                                       const std::string& label, bool& again, std::string& err);

    // Block until the socket is ready in the direction libssh2 is waiting on.
    virtual void wait_socket();

private:
    // Call op with the io mutex held until it stops returning EAGAIN.
    // Returns op's result, or LIBSSH2_ERROR_TIMEOUT once deadline passes.
    long io_call(const std::function<long()>& op, Clock::time_point deadline);

    void release(LIBSSH2_CHANNEL* channel);
};
