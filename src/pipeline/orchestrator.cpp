#include "hirespipe/pipeline/orchestrator.hpp"

#include "hirespipe/core/errors.hpp"
#include "hirespipe/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace hirespipe::pipeline {

namespace {

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

fs::path normalized_dir(const std::string& dir) {
    fs::path p = fs::absolute(fs::path(dir)).lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

} // namespace

std::chrono::milliseconds compute_backoff_delay(int attempt, int base_delay_ms, double factor,
                                                int max_delay_ms) {
    if (attempt < 1) attempt = 1;
    double delay = static_cast<double>(base_delay_ms) * std::pow(factor, attempt - 1);
    delay = std::min(delay, static_cast<double>(max_delay_ms));
    delay = std::max(delay, 0.0);
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

PipelineOrchestrator::PipelineOrchestrator(config::Config cfg, TransformAdapter& transform,
                                           core::EventEmitter& events,
                                           core::ShutdownSignal& signal, FileProbe* probe,
                                           Clock* clock)
    : cfg_(std::move(cfg)),
      transform_(transform),
      events_(events),
      signal_(signal),
      probe_(probe),
      clock_(clock),
      queue_(static_cast<size_t>(std::max(1, cfg_.queue_capacity))) {
    if (!probe_) {
        own_probe_ = std::make_unique<PosixFileProbe>();
        probe_ = own_probe_.get();
    }
    if (!clock_) {
        own_clock_ = std::make_unique<SignalClock>(signal_);
        clock_ = own_clock_.get();
    }
}

PipelineOrchestrator::~PipelineOrchestrator() {
    shutdown();
}

void PipelineOrchestrator::start() {
    if (started_.load()) {
        return;
    }

    source_dir_ = normalized_dir(cfg_.source_dir);
    dest_dir_ = normalized_dir(cfg_.dest_dir);

    std::error_code ec;
    fs::create_directories(dest_dir_, ec);
    if (ec || !fs::is_directory(dest_dir_)) {
        throw StartupError("cannot create destination directory " + dest_dir_.string() + ": " +
                           ec.message());
    }

    if (cfg_.history_file) {
        const fs::path log_dir = cfg_.effective_log_dir();
        fs::create_directories(log_dir, ec);
        if (ec) {
            throw StartupError("cannot create log directory " + log_dir.string() + ": " +
                               ec.message());
        }
        history_path_ = log_dir / "history.txt";
    }

    try {
        ledger_ = Ledger::open(cfg_.effective_ledger_path());
    } catch (const IOError& e) {
        throw StartupError(e.what());
    }
    events_.emit("ledger_loaded", {{"ledger", ledger_->path().string()},
                                   {"entries", ledger_->size()}});
    if (ledger_->skipped_lines() > 0) {
        events_.warning("ledger lines skipped",
                        {{"ledger", ledger_->path().string()},
                         {"count", ledger_->skipped_lines()}});
    }

    delivery_ = std::make_unique<AtomicDelivery>(dest_dir_, cfg_.overwrite_existing,
                                                 cfg_.fsync_on_delivery);
    const size_t swept = delivery_->sweep_stale_temp_files();
    if (swept > 0) {
        events_.warning("removed stale delivery temp files", {{"count", swept}});
    }

    StabilitySettings ss;
    ss.poll_interval = std::chrono::milliseconds(cfg_.stability_poll_interval_ms);
    ss.required_samples = cfg_.stability_required_samples;
    ss.timeout = std::chrono::milliseconds(cfg_.stability_timeout_ms);
    detector_ = std::make_unique<StabilityDetector>(ss, *probe_, *clock_);

    WatcherSettings ws;
    ws.source_dir = source_dir_;
    ws.recursive = cfg_.recursive;
    ws.extensions = cfg_.extensions;
    ws.poll_interval = std::chrono::milliseconds(cfg_.watch_poll_interval_ms);
    watcher_ = std::make_unique<Watcher>(ws, queue_, *ledger_, events_, signal_);

    if (!watcher_->wait_for_source(std::chrono::milliseconds(cfg_.source_wait_timeout_ms))) {
        if (signal_.requested()) {
            throw StopRequested();
        }
        throw StartupError("source directory " + source_dir_.string() + " not available after " +
                           std::to_string(cfg_.source_wait_timeout_ms) + " ms");
    }

    for (int i = 0; i < cfg_.worker_count; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    started_.store(true);
}

void PipelineOrchestrator::run() {
    start();
    watcher_->start();
    while (signal_.wait_for(std::chrono::seconds(1))) {
    }
    shutdown();
}

void PipelineOrchestrator::run_once() {
    start();
    watcher_->scan_once();
    queue_.wait_idle();
    shutdown();
}

void PipelineOrchestrator::shutdown() {
    queue_.close();
    if (watcher_) {
        watcher_->stop();
    }
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

void PipelineOrchestrator::worker_loop(int worker_id) {
    while (auto job = queue_.dequeue()) {
        const auto started = std::chrono::steady_clock::now();
        try {
            if (signal_.requested()) {
                abandon(*job);
            } else {
                process_job(*job);
            }
        } catch (const LedgerWriteFailure& e) {
            record_fatal(e.what());
        } catch (const std::exception& e) {
            std::cerr << "[WORKER " << worker_id << "] Unexpected error on " << job->source_path
                      << ": " << e.what() << std::endl;
            try {
                fail(*job, FailureReason::Aborted, e.what(), started);
            } catch (const std::exception& inner) {
                std::cerr << "[WORKER " << worker_id << "] Cannot record failure of "
                          << job->source_path << ": " << inner.what() << std::endl;
            }
        }
        if (is_terminal(job->state) && watcher_) {
            watcher_->settle(job->source_path, job->size_snapshot, job->mtime_snapshot_ns);
        }
        queue_.complete(job->source_path);
    }
}

void PipelineOrchestrator::transition(Job& job, JobState to) {
    const JobState from = job.state;
    job.state = to;
    events_.job_state(job, from, to);
}

JobState PipelineOrchestrator::fail(Job& job, FailureReason reason, const std::string& message,
                                    std::chrono::steady_clock::time_point started) {
    job.failure = reason;
    job.last_error = message;
    transition(job, JobState::Failed);
    const double duration = seconds_since(started);
    events_.job_failed(job, duration);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.failed;
    }
    write_history("FAILED     " + job.source_path.string() + " (attempts " +
                  std::to_string(job.attempt_count) + "): " +
                  failure_reason_to_string(reason) + ": " + message);
    return job.state;
}

JobState PipelineOrchestrator::abandon(Job& job) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.abandoned;
    }
    events_.emit("job_abandoned", {{"source_path", job.source_path.string()},
                                   {"state", job_state_to_string(job.state)},
                                   {"attempt", job.attempt_count}});
    return job.state;
}

void PipelineOrchestrator::record_fatal(const std::string& message) {
    if (fatal_.exchange(true)) {
        return;
    }
    events_.error(message, {{"fatal", true}});
    std::cerr << "[LEDGER] " << message << ", stopping" << std::endl;
    signal_.request();
}

void PipelineOrchestrator::write_history(const std::string& line) {
    if (history_path_.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(history_mutex_);
    std::ofstream out(history_path_, std::ios::app);
    if (!out) {
        std::cerr << "[HISTORY] Cannot write " << history_path_ << std::endl;
        return;
    }
    out << core::get_iso_timestamp() << "  " << line << "\n";
}

JobState PipelineOrchestrator::process_job(Job& job) {
    const auto started = std::chrono::steady_clock::now();

    if (job.relative_path.empty()) {
        fs::path rel = job.source_path.lexically_relative(source_dir_);
        if (rel.empty() || *rel.begin() == "..") {
            rel = job.source_path.filename();
        }
        job.relative_path = rel;
    }
    job.dest_path = dest_dir_ / transform_.output_name(job.relative_path);

    // Discovered -> Stabilizing
    transition(job, JobState::Stabilizing);
    const StabilityResult sr = detector_->wait_until_stable(job.source_path);
    switch (sr.outcome) {
        case StabilityOutcome::Cancelled:
            return abandon(job);
        case StabilityOutcome::Vanished:
            return fail(job, FailureReason::SourceVanished,
                        "source disappeared before it settled", started);
        case StabilityOutcome::Timeout:
            job.size_snapshot = sr.last.size;
            job.mtime_snapshot_ns = sr.last.mtime_ns;
            return fail(job, FailureReason::StabilityTimeout,
                        "not stable after " + std::to_string(sr.waited_ms) + " ms", started);
        case StabilityOutcome::Stable:
            break;
    }
    job.size_snapshot = sr.last.size;
    job.mtime_snapshot_ns = sr.last.mtime_ns;
    transition(job, JobState::Queued);

    if (signal_.requested()) {
        return abandon(job);
    }
    transition(job, JobState::Processing);

    const std::string key = job.source_path.string();
    TransformResult result;
    for (int attempt = 1; attempt <= cfg_.max_retries; ++attempt) {
        job.attempt_count = attempt;
        try {
            if (job.fingerprint.empty()) {
                job.fingerprint = core::sha256_file(job.source_path);
                if (ledger_->contains(key, job.fingerprint)) {
                    transition(job, JobState::Delivered);
                    events_.job_duplicate(job, "fingerprint already in ledger");
                    {
                        std::lock_guard<std::mutex> lock(stats_mutex_);
                        ++stats_.duplicates;
                    }
                    write_history("DUPLICATE  " + key + " (already delivered)");
                    return job.state;
                }
            }
            result = transform_.transform(job.source_path);
        } catch (const InvalidInput& e) {
            result = TransformResult::failure(ErrorKind::InvalidInput, e.what());
        } catch (const std::exception& e) {
            std::error_code ec;
            if (!fs::exists(job.source_path, ec)) {
                return fail(job, FailureReason::SourceVanished, e.what(), started);
            }
            result = TransformResult::failure(ErrorKind::TransientFailure, e.what());
        }

        if (result.ok()) {
            break;
        }
        if (result.error == ErrorKind::InvalidInput) {
            return fail(job, FailureReason::InvalidInput, result.message, started);
        }
        job.last_error = result.message;
        if (attempt >= cfg_.max_retries) {
            return fail(job, FailureReason::RetriesExhausted,
                        result.message + " (after " + std::to_string(attempt) + " attempts)",
                        started);
        }

        const auto delay = compute_backoff_delay(attempt, cfg_.retry_base_delay_ms,
                                                 cfg_.retry_backoff_factor,
                                                 cfg_.retry_max_delay_ms);
        events_.job_retry(job, delay.count(), result.message);
        std::cerr << "[TRANSFORM] " << error_kind_to_string(result.error) << " on " << key
                  << " (attempt " << attempt << "), retrying in " << delay.count()
                  << " ms: " << result.message << std::endl;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.retries;
        }
        if (!signal_.wait_for(delay)) {
            return abandon(job);
        }
    }

    // Last checkpoint: past this point the job always runs to completion.
    if (signal_.requested()) {
        return abandon(job);
    }

    DeliveryOutcome outcome = DeliveryOutcome::Delivered;
    try {
        outcome = delivery_->deliver(result.bytes, job.dest_path);
    } catch (const DeliveryFailure& e) {
        return fail(job, FailureReason::DeliveryFailure, e.what(), started);
    }

    LedgerEntry entry;
    entry.source_path = key;
    entry.fingerprint = job.fingerprint;
    entry.destination_path = job.dest_path.string();
    entry.completed_at = core::get_iso_timestamp();
    entry.source_size = job.size_snapshot;
    entry.source_mtime_ns = job.mtime_snapshot_ns;
    ledger_->append(entry);

    transition(job, JobState::Delivered);
    const double duration = seconds_since(started);

    if (outcome == DeliveryOutcome::SkippedExisting) {
        events_.job_duplicate(job, "destination exists");
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.duplicates;
        }
        write_history("DUPLICATE  " + key + " -> " + job.dest_path.string() +
                      " (destination exists)");
        return job.state;
    }

    events_.job_delivered(job, duration);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.delivered;
        stats_.bytes_delivered += result.bytes.size();
    }
    std::ostringstream line;
    line << "DELIVERED  " << key << " -> " << job.dest_path.string() << " ("
         << core::format_bytes(result.bytes.size()) << ", " << std::fixed
         << std::setprecision(2) << duration << "s, attempts " << job.attempt_count << ")";
    write_history(line.str());

    if (cfg_.delete_source_on_success) {
        std::error_code ec;
        if (fs::remove(job.source_path, ec)) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.sources_deleted;
        } else if (ec) {
            events_.warning("cannot delete source",
                            {{"source_path", key}, {"error", ec.message()}});
        }
    }
    return job.state;
}

OrchestratorStats PipelineOrchestrator::stats() const {
    OrchestratorStats s;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        s = stats_;
    }
    if (watcher_) {
        s.discovered = watcher_->stats().enqueued;
    }
    return s;
}

int PipelineOrchestrator::exit_code() const {
    return fatal_.load() ? kExitLedgerFailure : kExitOk;
}

} // namespace hirespipe::pipeline
