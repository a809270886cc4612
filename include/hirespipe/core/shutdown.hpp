#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace hirespipe::core {

/**
 * Process-wide stop flag with a cancellable timed wait.
 * Every sleep in the pipeline (watch poll, stability sampling, retry
 * backoff) goes through wait_for() so request() interrupts it at once.
 */
class ShutdownSignal {
public:
    ShutdownSignal() = default;
    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    void request();
    bool requested() const { return requested_.load(); }

    // Returns false if the signal fired before the duration elapsed.
    bool wait_for(std::chrono::milliseconds duration);

    // Callbacks run once, on the thread that calls request().
    void on_request(std::function<void()> callback);

private:
    std::atomic<bool> requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::function<void()>> callbacks_;
};

} // namespace hirespipe::core
