#pragma once

#include "hirespipe/core/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace hirespipe::pipeline {

enum class EnqueueResult {
    Enqueued,
    Duplicate,
    Closed
};

/**
 * Bounded FIFO of jobs keyed by source path.
 *
 * A path is "active" from enqueue until complete() is called for it, and
 * at most one job per active path exists. enqueue_if_absent() blocks while
 * the queue is full; dequeue() blocks while it is empty. close() releases
 * every blocked caller.
 */
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity);

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    EnqueueResult enqueue_if_absent(Job job);

    // Empty optional once the queue is closed and drained.
    std::optional<Job> dequeue();

    // Drops the path from the in-flight set. Wakes waiters on an idle queue.
    void complete(const fs::path& source_path);

    // Blocks until nothing is queued or in flight (or the queue is closed).
    void wait_idle();

    void close();
    bool closed() const;

    bool contains(const fs::path& source_path) const;
    size_t size() const;
    size_t in_flight() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::condition_variable idle_;
    std::deque<Job> pending_;
    std::unordered_set<std::string> active_;   // queued + in flight
    size_t in_flight_ = 0;
    bool closed_ = false;
};

} // namespace hirespipe::pipeline
