#include <gtest/gtest.h>
#include <transfer/worker_pool.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

static std::vector<std::string> items(size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < n; ++i) out.push_back("item" + std::to_string(i));
    return out;
}

TEST(WorkerPool, RunsEveryItemOnce) {
    WorkerPool pool(4);
    std::mutex mu;
    std::multiset<std::string> seen;

    size_t started = pool.run(items(50), [&](const std::string& item) {
        std::lock_guard<std::mutex> lock(mu);
        seen.insert(item);
    });

    EXPECT_EQ(started, 50u);
    ASSERT_EQ(seen.size(), 50u);
    for (const auto& it : items(50)) EXPECT_EQ(seen.count(it), 1u);
}

TEST(WorkerPool, NeverExceedsCapacity) {
    const size_t capacity = 3;
    WorkerPool pool(capacity);
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    pool.run(items(30), [&](const std::string&) {
        int now = ++in_flight;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --in_flight;
    });

    EXPECT_LE(peak.load(), static_cast<int>(capacity));
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPool, ThrowingTaskDoesNotStopOthers) {
    WorkerPool pool(2);
    std::atomic<int> done{0};

    pool.run(items(10), [&](const std::string& item) {
        if (item == "item3") throw std::runtime_error("copy failed");
        ++done;
    });

    EXPECT_EQ(done.load(), 9);
}

TEST(WorkerPool, NonStandardExceptionDoesNotStopOthers) {
    WorkerPool pool(3);
    std::atomic<int> done{0};

    size_t started = pool.run(items(12), [&](const std::string& item) {
        if (item == "item0" || item == "item7") throw 42;
        ++done;
    });

    EXPECT_EQ(started, 12u);
    EXPECT_EQ(done.load(), 10);
}

TEST(WorkerPool, EmptyInput) {
    WorkerPool pool(2);
    EXPECT_EQ(pool.run({}, [](const std::string&) {}), 0u);
}

TEST(WorkerPool, ZeroCapacityRejected) {
    EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}
