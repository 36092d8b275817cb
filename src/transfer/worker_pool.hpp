#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// Runs one task per item with at most `capacity` tasks in flight. A worker
// takes the next item as soon as its previous one finishes, so a slow item
// never holds back the rest.
class WorkerPool {
public:
    explicit WorkerPool(size_t capacity);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    using Task = std::function<void(const std::string& item)>;

    // Blocks until every item has been handled. A task that throws is logged
    // and counted as done. After an interrupt, workers stop taking new items.
    // Returns the number of items whose task was started.
    size_t run(const std::vector<std::string>& items, const Task& task);

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
};
