#pragma once

#include "hirespipe/config/configuration.hpp"
#include "hirespipe/core/events.hpp"
#include "hirespipe/core/shutdown.hpp"
#include "hirespipe/core/types.hpp"
#include "hirespipe/pipeline/atomic_delivery.hpp"
#include "hirespipe/pipeline/ledger.hpp"
#include "hirespipe/pipeline/stability.hpp"
#include "hirespipe/pipeline/transform.hpp"
#include "hirespipe/pipeline/watcher.hpp"
#include "hirespipe/pipeline/work_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hirespipe::pipeline {

struct OrchestratorStats {
    uint64_t discovered = 0;
    uint64_t delivered = 0;
    uint64_t duplicates = 0;        // ledger fingerprint hits and existing destinations
    uint64_t failed = 0;
    uint64_t retries = 0;
    uint64_t abandoned = 0;         // dropped at a checkpoint after a stop request
    uint64_t sources_deleted = 0;
    uint64_t bytes_delivered = 0;
};

// min(base * factor^(attempt-1), max) for the retry that follows `attempt`.
std::chrono::milliseconds compute_backoff_delay(int attempt, int base_delay_ms, double factor,
                                                int max_delay_ms);

/**
 * Drives every job from Discovered to Delivered or Failed.
 *
 * start() performs the startup checks (destination and log directory,
 * source directory with a bounded wait, ledger) and launches the worker
 * pool. run() additionally starts the watcher thread and blocks until the
 * shutdown signal; run_once() processes what is present now and returns.
 *
 * A LedgerWriteFailure on any worker is fatal: the shutdown signal is raised
 * and exit_code() reports 3.
 */
class PipelineOrchestrator {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitLedgerFailure = 3;

    // probe and clock default to the POSIX probe and a signal-driven clock.
    PipelineOrchestrator(config::Config cfg, TransformAdapter& transform,
                         core::EventEmitter& events, core::ShutdownSignal& signal,
                         FileProbe* probe = nullptr, Clock* clock = nullptr);
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    // Throws StartupError, or StopRequested if stopped while waiting for the source.
    void start();

    void run();
    void run_once();

    // Closes the queue and joins the watcher and workers. Idempotent.
    void shutdown();

    // Runs one job through stability, transform, delivery and the ledger.
    // Returns the state the job ended in; a non-terminal state means the job
    // was abandoned because of a stop request.
    JobState process_job(Job& job);

    OrchestratorStats stats() const;
    int exit_code() const;
    bool fatal() const { return fatal_.load(); }

    const config::Config& config() const { return cfg_; }
    Ledger* ledger() { return ledger_.get(); }
    Watcher* watcher() { return watcher_.get(); }
    WorkQueue& queue() { return queue_; }

private:
    void worker_loop(int worker_id);
    void transition(Job& job, JobState to);
    JobState fail(Job& job, FailureReason reason, const std::string& message,
                  std::chrono::steady_clock::time_point started);
    JobState abandon(Job& job);
    void record_fatal(const std::string& message);
    void write_history(const std::string& line);

    config::Config cfg_;
    TransformAdapter& transform_;
    core::EventEmitter& events_;
    core::ShutdownSignal& signal_;

    std::unique_ptr<FileProbe> own_probe_;
    std::unique_ptr<Clock> own_clock_;
    FileProbe* probe_;
    Clock* clock_;

    WorkQueue queue_;
    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<AtomicDelivery> delivery_;
    std::unique_ptr<StabilityDetector> detector_;
    std::unique_ptr<Watcher> watcher_;
    std::vector<std::thread> workers_;

    fs::path source_dir_;
    fs::path dest_dir_;
    fs::path history_path_;
    std::mutex history_mutex_;

    mutable std::mutex stats_mutex_;
    OrchestratorStats stats_;

    std::atomic<bool> started_{false};
    std::atomic<bool> fatal_{false};
};

} // namespace hirespipe::pipeline
