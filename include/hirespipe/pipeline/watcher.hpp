#pragma once

#include "hirespipe/core/events.hpp"
#include "hirespipe/core/shutdown.hpp"
#include "hirespipe/pipeline/ledger.hpp"
#include "hirespipe/pipeline/work_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hirespipe::pipeline {

namespace fs = std::filesystem;

struct WatcherSettings {
    fs::path source_dir;
    bool recursive = false;
    std::vector<std::string> extensions;   // lowercase, with or without the dot; empty = all
    std::chrono::milliseconds poll_interval{1000};
};

struct WatcherStats {
    uint64_t scans = 0;
    uint64_t enqueued = 0;
    uint64_t already_delivered = 0;   // ledger signature hits
    uint64_t scan_errors = 0;
};

/**
 * Polls the source directory and turns new or changed regular files into
 * Discovered jobs.
 *
 * A path is offered to the queue when its (size, mtime) differs from the
 * last signature the watcher accepted for it, so a file that failed is only
 * retried once it has been rewritten. Hidden files and delivery temp files
 * are ignored. Enqueueing blocks while the queue is full.
 */
class Watcher {
public:
    Watcher(WatcherSettings settings, WorkQueue& queue, const Ledger& ledger,
            core::EventEmitter& events, core::ShutdownSignal& signal);
    ~Watcher();

    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;

    // Polls for the source directory until it exists. False on timeout or stop.
    bool wait_for_source(std::chrono::milliseconds timeout);

    // One pass over the source tree. Returns the number of jobs enqueued.
    size_t scan_once();

    // Scans every poll_interval on a background thread until the shutdown
    // signal fires or stop() is called. stop() returns once the thread exits.
    void start();
    void stop();

    bool accepts(const fs::path& path) const;

    // Records the signature a finished job ended with, so a file that was
    // still growing when it was first seen is not offered again unchanged.
    void settle(const fs::path& path, uint64_t size, int64_t mtime_ns);

    WatcherStats stats() const;
    const WatcherSettings& settings() const { return settings_; }

private:
    struct Signature {
        uint64_t size = 0;
        int64_t mtime_ns = 0;
        bool operator==(const Signature& o) const { return size == o.size && mtime_ns == o.mtime_ns; }
    };

    void run_loop();
    bool offer(const fs::path& path, const Signature& sig);

    WatcherSettings settings_;
    WorkQueue& queue_;
    const Ledger& ledger_;
    core::EventEmitter& events_;
    core::ShutdownSignal& signal_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Signature> seen_;
    WatcherStats stats_;
    bool missing_reported_ = false;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // namespace hirespipe::pipeline
