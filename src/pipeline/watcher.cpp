#include "hirespipe/pipeline/watcher.hpp"

#include "hirespipe/core/utils.hpp"
#include "hirespipe/pipeline/atomic_delivery.hpp"
#include "hirespipe/pipeline/stability.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <unordered_set>

namespace hirespipe::pipeline {

Watcher::Watcher(WatcherSettings settings, WorkQueue& queue, const Ledger& ledger,
                 core::EventEmitter& events, core::ShutdownSignal& signal)
    : settings_(std::move(settings)),
      queue_(queue),
      ledger_(ledger),
      events_(events),
      signal_(signal) {
    for (auto& ext : settings_.extensions) {
        ext = core::to_lower(ext);
        if (!ext.empty() && ext[0] != '.') {
            ext = "." + ext;
        }
    }
}

Watcher::~Watcher() {
    stop();
}

bool Watcher::wait_for_source(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto step = std::min(settings_.poll_interval, std::chrono::milliseconds(250));
    bool reported = false;

    while (true) {
        std::error_code ec;
        if (fs::is_directory(settings_.source_dir, ec)) {
            return true;
        }
        if (!reported) {
            std::cerr << "[WATCHER] Waiting for source directory " << settings_.source_dir
                      << std::endl;
            reported = true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (!signal_.wait_for(step)) {
            return false;
        }
    }
}

bool Watcher::accepts(const fs::path& path) const {
    const std::string name = path.filename().string();
    if (name.empty() || name[0] == '.') {
        return false;
    }
    if (AtomicDelivery::is_temp_name(name)) {
        return false;
    }
    if (settings_.extensions.empty()) {
        return true;
    }
    const std::string ext = core::to_lower(path.extension().string());
    for (const auto& allowed : settings_.extensions) {
        if (ext == allowed) {
            return true;
        }
    }
    return false;
}

bool Watcher::offer(const fs::path& path, const Signature& sig) {
    const std::string key = path.string();

    if (ledger_.matches_signature(key, sig.size, sig.mtime_ns)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!(seen_.count(key) && seen_[key] == sig)) {
            ++stats_.already_delivered;
        }
        seen_[key] = sig;
        return false;
    }

    Job job;
    job.source_path = path;
    job.relative_path = path.lexically_relative(settings_.source_dir);
    job.discovered_at = std::chrono::system_clock::now();
    job.size_snapshot = sig.size;
    job.mtime_snapshot_ns = sig.mtime_ns;
    job.state = JobState::Discovered;

    switch (queue_.enqueue_if_absent(job)) {
        case EnqueueResult::Enqueued: {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_[key] = sig;
            ++stats_.enqueued;
            break;
        }
        case EnqueueResult::Duplicate:
            // Still active; the new signature is picked up after it completes.
            return false;
        case EnqueueResult::Closed:
            return false;
    }
    events_.job_discovered(job);
    return true;
}

void Watcher::settle(const fs::path& path, uint64_t size, int64_t mtime_ns) {
    Signature sig;
    sig.size = size;
    sig.mtime_ns = mtime_ns;
    std::lock_guard<std::mutex> lock(mutex_);
    seen_[path.string()] = sig;
}

size_t Watcher::scan_once() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.scans;
    }

    std::error_code ec;
    if (!fs::is_directory(settings_.source_dir, ec)) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.scan_errors;
        if (!missing_reported_) {
            missing_reported_ = true;
            events_.warning("source directory unavailable",
                            {{"source_dir", settings_.source_dir.string()}});
        }
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        missing_reported_ = false;
    }

    // Same stat(2) view the stability detector and the ledger use.
    PosixFileProbe probe;
    std::vector<std::pair<fs::path, Signature>> candidates;
    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code fec;
        if (!entry.is_regular_file(fec) || !accepts(entry.path())) {
            return;
        }
        const FileSample sample = probe.sample(entry.path());
        if (!sample.exists) {
            return;
        }
        Signature sig;
        sig.size = sample.size;
        sig.mtime_ns = sample.mtime_ns;
        candidates.emplace_back(entry.path(), sig);
    };

    const auto opts = fs::directory_options::skip_permission_denied;
    if (settings_.recursive) {
        fs::recursive_directory_iterator it(settings_.source_dir, opts, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code dec;
            if (it->is_directory(dec) && it->path().filename().string()[0] == '.') {
                it.disable_recursion_pending();
                continue;
            }
            consider(*it);
        }
    } else {
        fs::directory_iterator it(settings_.source_dir, opts, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            consider(*it);
        }
    }
    if (ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.scan_errors;
        std::cerr << "[WATCHER] Scan of " << settings_.source_dir << " failed: " << ec.message()
                  << std::endl;
    }

    std::unordered_set<std::string> present;
    size_t enqueued = 0;
    for (const auto& [path, sig] : candidates) {
        if (signal_.requested()) {
            break;
        }
        present.insert(path.string());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = seen_.find(path.string());
            if (it != seen_.end() && it->second == sig) {
                continue;
            }
        }
        if (offer(path, sig)) {
            ++enqueued;
        }
    }

    if (!ec && !signal_.requested()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = seen_.begin(); it != seen_.end();) {
            if (present.count(it->first)) {
                ++it;
            } else {
                it = seen_.erase(it);
            }
        }
    }
    return enqueued;
}

void Watcher::start() {
    thread_ = std::thread([this] { run_loop(); });
}

void Watcher::stop() {
    stop_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Watcher::run_loop() {
    while (!signal_.requested() && !stop_.load()) {
        try {
            scan_once();
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.scan_errors;
            std::cerr << "[WATCHER] Scan error: " << e.what() << std::endl;
        }
        if (!signal_.wait_for(settings_.poll_interval)) {
            break;
        }
    }
}

WatcherStats Watcher::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace hirespipe::pipeline
