#include "session.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(NIMBUS_INVALID_SOCKET),
      lib_initialized_(false), failure_(SessionFailure::None),
      target_str_(target.user + "@" + target.host),
      io_mutex_(std::make_shared<std::mutex>()),
      setup_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::fail(SessionFailure kind, const std::string& message) {
    failure_ = kind;
    nimbus_log("Session to " + target_str_ + " failed: " + message);
    close();
    return SSHResult{-1, "", message};
}

SSHResult SessionManager::establish(StatusCallback callback) {
    failure_ = SessionFailure::None;
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    // Initialize libssh2
    if (!lib_initialized_) {
        if (libssh2_init(0) != 0) {
            return fail(SessionFailure::Unreachable, "Failed to initialize libssh2");
        }
        lib_initialized_ = true;
    }

    std::string err;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout, err);
    if (sock_ == NIMBUS_INVALID_SOCKET) {
        return fail(SessionFailure::Unreachable, err);
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail(SessionFailure::Unreachable, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(target_.timeout) * 1000);

    // SSH handshake (key exchange)
    int ret = libssh2_session_handshake(session_, sock_);
    if (ret != 0) {
        char* msg = nullptr;
        libssh2_session_last_error(session_, &msg, nullptr, 0);
        return fail(SessionFailure::Unreachable,
                    "SSH handshake with " + target_.host + " failed" +
                    (msg ? std::string(": ") + msg : ""));
    }

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif

    // SSH keepalive every 30s so long uploads don't look idle to the server
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = authenticate(session_, target_, callback);
    if (auth_result.failed()) {
        return fail(SessionFailure::AuthFailed, auth_result.stderr_data);
    }

    // From here on channels are multiplexed; callers retry on EAGAIN.
    libssh2_session_set_timeout(session_, 0);
    libssh2_session_set_blocking(session_, 0);

    if (callback) {
        callback("Connected to " + target_str_);
    }
    return SSHResult{0, "", ""};
}

void SessionManager::close() {
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            // Blocking again so disconnect is actually sent before the socket closes.
            libssh2_session_set_blocking(session_, 1);
            libssh2_session_set_timeout(session_, 5000);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != NIMBUS_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = NIMBUS_INVALID_SOCKET;
    }

    if (lib_initialized_) {
        libssh2_exit();
        lib_initialized_ = false;
    }
}
