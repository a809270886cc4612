#include "hirespipe/pipeline/work_queue.hpp"

#include <utility>

namespace hirespipe::pipeline {

WorkQueue::WorkQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

EnqueueResult WorkQueue::enqueue_if_absent(Job job) {
    const std::string key = job.source_path.string();

    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return EnqueueResult::Closed;
    }
    if (active_.count(key) != 0) {
        return EnqueueResult::Duplicate;
    }

    not_full_.wait(lock, [this] { return closed_ || pending_.size() < capacity_; });
    if (closed_) {
        return EnqueueResult::Closed;
    }
    // Another producer may have claimed the path while we waited.
    if (active_.count(key) != 0) {
        return EnqueueResult::Duplicate;
    }

    active_.insert(key);
    pending_.push_back(std::move(job));
    lock.unlock();
    not_empty_.notify_one();
    return EnqueueResult::Enqueued;
}

std::optional<Job> WorkQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !pending_.empty(); });
    if (pending_.empty()) {
        return std::nullopt;
    }

    Job job = std::move(pending_.front());
    pending_.pop_front();
    ++in_flight_;
    lock.unlock();
    not_full_.notify_one();
    return job;
}

void WorkQueue::complete(const fs::path& source_path) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (active_.erase(source_path.string()) == 0) {
        return;
    }
    if (in_flight_ > 0) {
        --in_flight_;
    }
    const bool idle = pending_.empty() && in_flight_ == 0;
    lock.unlock();
    if (idle) {
        idle_.notify_all();
    }
}

void WorkQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return closed_ || (pending_.empty() && in_flight_ == 0); });
}

void WorkQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
    idle_.notify_all();
}

bool WorkQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool WorkQueue::contains(const fs::path& source_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(source_path.string()) != 0;
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t WorkQueue::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

} // namespace hirespipe::pipeline
