#include "connection.hpp"
#include <core/constants.hpp>
#include <core/interrupt.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <algorithm>
#include <fstream>
#include <vector>

SSHConnection::SSHConnection(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex,
                             int sock, std::shared_ptr<std::mutex> setup_mutex)
    : session_(session), io_mutex_(std::move(io_mutex)),
      setup_mutex_(setup_mutex ? std::move(setup_mutex) : std::make_shared<std::mutex>()),
      sock_(sock) {
}

void SSHConnection::wait_socket() {
    int dir;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        dir = libssh2_session_block_directions(session_);
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;

    // Another thread may have already drained what we were waiting for,
    // so the wait is always bounded.
    if (events == 0 || sock_ < 0) {
        platform::sleep_ms(SSH_SOCKET_WAIT_MS);
        return;
    }
    platform::poll_socket(sock_, events, SSH_SOCKET_WAIT_MS);
}

long SSHConnection::io_call(const std::function<long()>& op, Clock::time_point deadline) {
    for (;;) {
        long rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = op();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (Clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        wait_socket();
    }
}

LIBSSH2_CHANNEL* SSHConnection::open_step(const std::function<LIBSSH2_CHANNEL*()>& op,
                                          const std::string& /*label*/, bool& again,
                                          std::string& err) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    again = false;
    LIBSSH2_CHANNEL* ch = op();
    if (ch) return ch;

    // The message points into the session's buffer; copy it before unlocking.
    char* msg = nullptr;
    int last = libssh2_session_last_error(session_, &msg, nullptr, 0);
    again = (last == LIBSSH2_ERROR_EAGAIN);
    err = msg ? msg : "channel open failed";
    return nullptr;
}

LIBSSH2_CHANNEL* SSHConnection::open_call(const std::function<LIBSSH2_CHANNEL*()>& op,
                                          const std::string& label, Clock::time_point deadline,
                                          std::string& err) {
    std::lock_guard<std::mutex> setup(*setup_mutex_);
    for (;;) {
        bool again = false;
        LIBSSH2_CHANNEL* ch = open_step(op, label, again, err);
        if (ch) return ch;
        if (!again) return nullptr;
        if (Clock::now() >= deadline) {
            err = "Timed out opening channel";
            nimbus_log("channel setup timed out: " + label);
            return nullptr;
        }
        wait_socket();
    }
}

void SSHConnection::release(LIBSSH2_CHANNEL* channel) {
    auto deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    io_call([&] { return static_cast<long>(libssh2_channel_close(channel)); }, deadline);
    io_call([&] { return static_cast<long>(libssh2_channel_free(channel)); }, deadline);
}

SSHResult SSHConnection::run(const std::string& command, int timeout_secs) {
    if (!session_) {
        return SSHResult{-1, "", "No session available"};
    }

    std::string err;
    auto open_deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    LIBSSH2_CHANNEL* ch = open_call([&] { return libssh2_channel_open_session(session_); },
                                    "exec", open_deadline, err);
    if (!ch) {
        return SSHResult{-1, "", "Failed to open exec channel: " + err};
    }

    long rc = io_call([&] { return static_cast<long>(libssh2_channel_exec(ch, command.c_str())); },
                      open_deadline);
    if (rc != 0) {
        release(ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Read stdout and stderr interleaved until the remote side closes
    std::string out, errs;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = Clock::now() + std::chrono::seconds(effective_timeout);
    bool timed_out = false;
    bool read_error = false;

    // Bounded by the deadline only; cleanup commands still run after SIGINT.
    for (;;) {
        ssize_t n_out, n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) out.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) errs.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(ch) != 0;
        }

        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            read_error = true;
            break;
        }
        if (n_out > 0 || n_err > 0) continue;
        if (eof) break;
        if (Clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        wait_socket();
    }

    int exit_status = -1;
    auto close_deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    rc = io_call([&] { return static_cast<long>(libssh2_channel_close(ch)); }, close_deadline);
    if (rc == 0) {
        rc = io_call([&] { return static_cast<long>(libssh2_channel_wait_closed(ch)); },
                     close_deadline);
    }
    if (rc == 0 && !timed_out && !read_error) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_status = libssh2_channel_get_exit_status(ch);
    }
    io_call([&] { return static_cast<long>(libssh2_channel_free(ch)); }, close_deadline);

    if (timed_out) {
        return SSHResult{-1, out, "Command timed out after " + std::to_string(effective_timeout) + "s"};
    }
    if (read_error) {
        return SSHResult{-1, out, "SSH channel read error"};
    }
    return SSHResult{exit_status, out, errs};
}

SSHResult SSHConnection::upload(const fs::path& local, const std::string& remote) {
    if (!session_) {
        return SSHResult{-1, "", "No session available"};
    }

    std::error_code ec;
    auto size = fs::file_size(local, ec);
    std::ifstream in(local, std::ios::binary);
    if (ec || !in) {
        return SSHResult{-1, "", "Cannot read file: " + local.string()};
    }

    std::string err;
    auto deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    LIBSSH2_CHANNEL* ch = open_call(
        [&] { return libssh2_scp_send64(session_, remote.c_str(), 0644,
                                        static_cast<libssh2_int64_t>(size), 0, 0); },
        "scp-send " + remote, deadline, err);
    if (!ch) {
        return SSHResult{-1, "", "SCP send to " + remote + " failed: " + err};
    }

    // Stall deadline: reset whenever bytes move.
    std::vector<char> buf(SCP_BUF_SIZE);
    uint64_t sent_total = 0;
    while (sent_total < size) {
        if (is_interrupted()) {
            release(ch);
            return SSHResult{-1, "", "Interrupted"};
        }
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        size_t len = static_cast<size_t>(in.gcount());
        if (len == 0) {
            release(ch);
            return SSHResult{-1, "", "Short read from " + local.string()};
        }

        size_t off = 0;
        while (off < len) {
            auto stall = Clock::now() + std::chrono::seconds(SSH_CMD_TIMEOUT_SECS);
            long w = io_call([&] { return static_cast<long>(
                                 libssh2_channel_write(ch, buf.data() + off, len - off)); },
                             stall);
            if (w < 0) {
                release(ch);
                return SSHResult{-1, "", "SCP write error on " + remote + " (rc=" +
                                         std::to_string(w) + ")"};
            }
            off += static_cast<size_t>(w);
        }
        sent_total += len;
    }

    auto finish = Clock::now() + std::chrono::seconds(SSH_CMD_TIMEOUT_SECS);
    long rc = io_call([&] { return static_cast<long>(libssh2_channel_send_eof(ch)); }, finish);
    if (rc == 0) rc = io_call([&] { return static_cast<long>(libssh2_channel_wait_eof(ch)); }, finish);
    if (rc == 0) rc = io_call([&] { return static_cast<long>(libssh2_channel_wait_closed(ch)); }, finish);
    io_call([&] { return static_cast<long>(libssh2_channel_free(ch)); }, finish);

    if (rc != 0) {
        return SSHResult{-1, "", "SCP upload of " + remote + " did not complete (rc=" +
                                 std::to_string(rc) + ")"};
    }
    return SSHResult{0, "", ""};
}

SSHResult SSHConnection::download(const std::string& remote, const fs::path& local) {
    if (!session_) {
        return SSHResult{-1, "", "No session available"};
    }

    std::string err;
    libssh2_struct_stat sb{};
    auto deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    LIBSSH2_CHANNEL* ch = open_call(
        [&] { return libssh2_scp_recv2(session_, remote.c_str(), &sb); },
        "scp-recv " + remote, deadline, err);
    if (!ch) {
        return SSHResult{-1, "", "SCP receive of " + remote + " failed: " + err};
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        release(ch);
        return SSHResult{-1, "", "Cannot write file: " + local.string()};
    }

    std::vector<char> buf(SCP_BUF_SIZE);
    auto remaining = static_cast<uint64_t>(sb.st_size);
    while (remaining > 0) {
        if (is_interrupted()) {
            release(ch);
            return SSHResult{-1, "", "Interrupted"};
        }
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
        auto stall = Clock::now() + std::chrono::seconds(SSH_CMD_TIMEOUT_SECS);
        long n = io_call([&] { return static_cast<long>(
                             libssh2_channel_read(ch, buf.data(), want)); },
                         stall);
        if (n <= 0) {
            release(ch);
            return SSHResult{-1, "", "SCP read error on " + remote + " (rc=" +
                                     std::to_string(n) + ")"};
        }
        out.write(buf.data(), n);
        remaining -= static_cast<uint64_t>(n);
    }

    release(ch);
    out.close();
    if (!out) {
        return SSHResult{-1, "", "Failed to write " + local.string()};
    }
    return SSHResult{0, "", ""};
}
