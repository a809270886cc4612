#include "hirespipe/core/shutdown.hpp"

#include <utility>

namespace hirespipe::core {

void ShutdownSignal::request() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_.exchange(true)) {
            return;
        }
        callbacks.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto& cb : callbacks) {
        cb();
    }
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return requested_.load(); });
}

void ShutdownSignal::on_request(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!requested_.load()) {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

} // namespace hirespipe::core
