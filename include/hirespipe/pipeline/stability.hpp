#pragma once

#include "hirespipe/core/shutdown.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace hirespipe::pipeline {

namespace fs = std::filesystem;

// One (size, mtime) observation of a file.
struct FileSample {
    bool exists = false;
    uint64_t size = 0;
    int64_t mtime_ns = 0;

    bool operator==(const FileSample& o) const {
        return exists == o.exists && size == o.size && mtime_ns == o.mtime_ns;
    }
    bool operator!=(const FileSample& o) const { return !(*this == o); }
};

// A single sample has nothing to be compared against.
constexpr int kMinStabilitySamples = 2;

/**
 * True once the last `required` samples all describe an existing file with
 * identical size and mtime. Fewer samples than `required` is never stable;
 * `required` is raised to kMinStabilitySamples.
 */
bool evaluate_stability(const std::vector<FileSample>& samples, int required);

class FileProbe {
public:
    virtual ~FileProbe() = default;
    virtual FileSample sample(const fs::path& path) = 0;
    // True when no other process holds the file; the check releases the lock.
    virtual bool can_open_exclusive(const fs::path& path) = 0;
};

// stat(2) for samples, open(2) + flock(LOCK_EX | LOCK_NB) for exclusivity.
class PosixFileProbe : public FileProbe {
public:
    FileSample sample(const fs::path& path) override;
    bool can_open_exclusive(const fs::path& path) override;
};

class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::steady_clock::time_point now() = 0;
    // Returns false if the wait was cancelled.
    virtual bool sleep_for(std::chrono::milliseconds duration) = 0;
};

// steady_clock whose sleeps are interrupted by the shutdown signal.
class SignalClock : public Clock {
public:
    explicit SignalClock(core::ShutdownSignal& signal) : signal_(signal) {}

    std::chrono::steady_clock::time_point now() override {
        return std::chrono::steady_clock::now();
    }
    bool sleep_for(std::chrono::milliseconds duration) override {
        return signal_.wait_for(duration);
    }

private:
    core::ShutdownSignal& signal_;
};

enum class StabilityOutcome {
    Stable,
    Timeout,
    Vanished,
    Cancelled
};

struct StabilityResult {
    StabilityOutcome outcome = StabilityOutcome::Timeout;
    FileSample last;
    int samples_taken = 0;
    long long waited_ms = 0;
};

struct StabilitySettings {
    std::chrono::milliseconds poll_interval{500};
    int required_samples = 2;
    std::chrono::milliseconds timeout{60000};
};

class StabilityDetector {
public:
    StabilityDetector(StabilitySettings settings, FileProbe& probe, Clock& clock);

    // Blocks, sampling at poll_interval, until the file settles, vanishes,
    // times out, or the clock's wait is cancelled.
    StabilityResult wait_until_stable(const fs::path& path) const;

    const StabilitySettings& settings() const { return settings_; }

private:
    StabilitySettings settings_;
    FileProbe& probe_;
    Clock& clock_;
};

} // namespace hirespipe::pipeline
