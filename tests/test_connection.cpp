#include <gtest/gtest.h>
#include <ssh/connection.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Behaves like a non-blocking libssh2 session: the first attempt of a setup
// leaves the request pending in the session and reports EAGAIN; the next
// attempt completes whatever request is pending, whoever makes it.
class PendingSetupConnection : public SSHConnection {
public:
    PendingSetupConnection() : SSHConnection(nullptr, std::make_shared<std::mutex>(), -1) {}

    using SSHConnection::open_call;

    std::string granted_to(LIBSSH2_CHANNEL* ch) {
        std::lock_guard<std::mutex> lock(state_mu_);
        return granted_.at(reinterpret_cast<uintptr_t>(ch) - 1);
    }

    bool fail_next = false;

protected:
    LIBSSH2_CHANNEL* open_step(const std::function<LIBSSH2_CHANNEL*()>&,
                               const std::string& label, bool& again, std::string& err) override {
        std::lock_guard<std::mutex> lock(state_mu_);
        if (fail_next) {
            again = false;
            err = "Channel open failure";
            return nullptr;
        }
        if (pending_.empty()) {
            pending_ = label;
            again = true;
            return nullptr;
        }
        granted_.push_back(pending_);
        pending_.clear();
        again = false;
        return reinterpret_cast<LIBSSH2_CHANNEL*>(static_cast<uintptr_t>(granted_.size()));
    }

    void wait_socket() override {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

private:
    std::mutex state_mu_;
    std::string pending_;
    std::vector<std::string> granted_;
};

static LIBSSH2_CHANNEL* no_op() { return nullptr; }

TEST(SSHConnection, ConcurrentSetupsEachGetTheirOwnChannel) {
    PendingSetupConnection conn;
    const int workers = 6;
    std::vector<std::string> got(workers);
    std::vector<std::thread> threads;

    for (int i = 0; i < workers; ++i) {
        threads.emplace_back([&conn, &got, i] {
            std::string label = "scp-send /tmp/x/archive.part.000" + std::to_string(i);
            std::string err;
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            LIBSSH2_CHANNEL* ch = conn.open_call(no_op, label, deadline, err);
            got[i] = ch ? conn.granted_to(ch) : "failed: " + err;
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < workers; ++i) {
        EXPECT_EQ(got[i], "scp-send /tmp/x/archive.part.000" + std::to_string(i));
    }
}

TEST(SSHConnection, HardSetupErrorIsReported) {
    PendingSetupConnection conn;
    conn.fail_next = true;
    std::string err;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    EXPECT_EQ(conn.open_call(no_op, "exec", deadline, err), nullptr);
    EXPECT_EQ(err, "Channel open failure");
}

TEST(SSHConnection, NoSessionFailsCleanly) {
    SSHConnection conn(nullptr, std::make_shared<std::mutex>(), -1);
    EXPECT_EQ(conn.run("true").exit_code, -1);
    EXPECT_TRUE(conn.download("/tmp/x", "/tmp/y").failed());
}
