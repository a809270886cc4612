#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace hirespipe {

namespace fs = std::filesystem;

using SystemTime = std::chrono::system_clock::time_point;

// Job lifecycle
enum class JobState {
    Discovered,
    Stabilizing,
    Queued,
    Processing,
    Delivered,
    Failed
};

inline std::string job_state_to_string(JobState state) {
    switch (state) {
        case JobState::Discovered: return "Discovered";
        case JobState::Stabilizing: return "Stabilizing";
        case JobState::Queued: return "Queued";
        case JobState::Processing: return "Processing";
        case JobState::Delivered: return "Delivered";
        case JobState::Failed: return "Failed";
        default: return "Unknown";
    }
}

inline bool is_terminal(JobState state) {
    return state == JobState::Delivered || state == JobState::Failed;
}

// Why a job ended up Failed
enum class FailureReason {
    None,
    StabilityTimeout,
    SourceVanished,
    InvalidInput,
    RetriesExhausted,
    DeliveryFailure,
    Aborted
};

inline std::string failure_reason_to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::None: return "none";
        case FailureReason::StabilityTimeout: return "stability timeout";
        case FailureReason::SourceVanished: return "source vanished";
        case FailureReason::InvalidInput: return "invalid input";
        case FailureReason::RetriesExhausted: return "retries exhausted";
        case FailureReason::DeliveryFailure: return "delivery failure";
        case FailureReason::Aborted: return "aborted";
        default: return "unknown";
    }
}

// One candidate file moving through the pipeline
struct Job {
    fs::path source_path;
    fs::path relative_path;     // relative to sourceDir, used for output naming
    SystemTime discovered_at{};
    uint64_t size_snapshot = 0;
    int64_t mtime_snapshot_ns = 0;
    int attempt_count = 0;
    JobState state = JobState::Discovered;
    FailureReason failure = FailureReason::None;
    std::string last_error;
    fs::path dest_path;
    std::string fingerprint;
};

} // namespace hirespipe
