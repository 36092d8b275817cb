#include "worker_pool.hpp"
#include <core/interrupt.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

WorkerPool::WorkerPool(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }
}

size_t WorkerPool::run(const std::vector<std::string>& items, const Task& task) {
    if (items.empty()) return 0;

    std::atomic<size_t> next{0};
    std::atomic<size_t> started{0};

    auto worker = [&]() {
        for (;;) {
            if (is_interrupted()) return;
            size_t i = next.fetch_add(1);
            if (i >= items.size()) return;
            started.fetch_add(1);
            try {
                task(items[i]);
            } catch (const std::exception& e) {
                nimbus_log("worker: " + items[i] + " failed: " + e.what());
            } catch (...) {
                nimbus_log("worker: " + items[i] + " failed: unknown exception");
            }
        }
    };

    size_t n = std::min(capacity_, items.size());
    std::vector<std::thread> threads;
    threads.reserve(n);
    for (size_t t = 0; t < n; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& th : threads) {
        th.join();
    }
    return started.load();
}
