#include "hirespipe/pipeline/stability.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using hirespipe::pipeline::Clock;
using hirespipe::pipeline::FileProbe;
using hirespipe::pipeline::FileSample;
using hirespipe::pipeline::StabilityDetector;
using hirespipe::pipeline::StabilityOutcome;
using hirespipe::pipeline::StabilitySettings;
using hirespipe::pipeline::evaluate_stability;

namespace {

FileSample at(uint64_t size, int64_t mtime) {
    FileSample s;
    s.exists = true;
    s.size = size;
    s.mtime_ns = mtime;
    return s;
}

// Replays a scripted sequence of samples; the last one repeats forever.
class ScriptedProbe : public FileProbe {
public:
    explicit ScriptedProbe(std::vector<FileSample> script) : script_(std::move(script)) {}

    FileSample sample(const std::filesystem::path&) override {
        ++calls;
        if (next_ < script_.size()) {
            return script_[next_++];
        }
        return script_.back();
    }
    bool can_open_exclusive(const std::filesystem::path&) override { return exclusive; }

    bool exclusive = true;
    int calls = 0;

private:
    std::vector<FileSample> script_;
    size_t next_ = 0;
};

// Virtual time: sleeping advances the clock instantly.
class ManualClock : public Clock {
public:
    std::chrono::steady_clock::time_point now() override { return now_; }
    bool sleep_for(std::chrono::milliseconds d) override {
        if (cancel_after >= 0 && sleeps >= cancel_after) {
            return false;
        }
        ++sleeps;
        now_ += d;
        return true;
    }

    int sleeps = 0;
    int cancel_after = -1;

private:
    std::chrono::steady_clock::time_point now_{};
};

StabilitySettings settings(int required, int poll_ms, int timeout_ms) {
    StabilitySettings s;
    s.required_samples = required;
    s.poll_interval = std::chrono::milliseconds(poll_ms);
    s.timeout = std::chrono::milliseconds(timeout_ms);
    return s;
}

} // namespace

TEST_CASE("evaluate_stability_requires_enough_samples") {
    REQUIRE_FALSE(evaluate_stability({}, 2));
    REQUIRE_FALSE(evaluate_stability({at(10, 1)}, 2));
    REQUIRE(evaluate_stability({at(10, 1), at(10, 1)}, 2));
}

TEST_CASE("evaluate_stability_only_looks_at_trailing_window") {
    std::vector<FileSample> samples = {at(5, 1), at(8, 2), at(10, 3), at(10, 3), at(10, 3)};
    REQUIRE(evaluate_stability(samples, 3));
    REQUIRE_FALSE(evaluate_stability(samples, 4));
}

TEST_CASE("evaluate_stability_detects_mtime_change_at_same_size") {
    REQUIRE_FALSE(evaluate_stability({at(10, 1), at(10, 2)}, 2));
}

TEST_CASE("evaluate_stability_rejects_missing_file") {
    FileSample gone;
    REQUIRE_FALSE(evaluate_stability({gone, gone}, 2));
}

TEST_CASE("single_sample_is_never_enough") {
    REQUIRE_FALSE(evaluate_stability({at(10, 1)}, 1));
    REQUIRE(evaluate_stability({at(10, 1), at(10, 1)}, 1));
}

TEST_CASE("detector_with_one_required_sample_still_compares_two") {
    ScriptedProbe probe({at(1000, 1), at(2000, 2), at(2000, 2)});
    ManualClock clock;
    StabilityDetector detector(settings(1, 10, 10000), probe, clock);

    auto result = detector.wait_until_stable("/virtual/appending.raw");

    REQUIRE(result.outcome == StabilityOutcome::Stable);
    REQUIRE(result.samples_taken == 3);
    REQUIRE(result.last.size == 2000);
}

TEST_CASE("detector_waits_for_growth_to_stop") {
    ScriptedProbe probe({at(100, 1), at(200, 2), at(300, 3), at(300, 3), at(300, 3)});
    ManualClock clock;
    StabilityDetector detector(settings(3, 100, 10000), probe, clock);

    auto result = detector.wait_until_stable("/virtual/file.raw");

    REQUIRE(result.outcome == StabilityOutcome::Stable);
    REQUIRE(result.samples_taken == 5);
    REQUIRE(result.last.size == 300);
    REQUIRE(clock.sleeps == 4);
}

TEST_CASE("detector_times_out_on_file_that_keeps_changing") {
    std::vector<FileSample> script;
    for (int i = 0; i < 100; ++i) {
        script.push_back(at(static_cast<uint64_t>(i), i));
    }
    ScriptedProbe probe(script);
    ManualClock clock;
    StabilityDetector detector(settings(2, 100, 1000), probe, clock);

    auto result = detector.wait_until_stable("/virtual/growing.raw");

    REQUIRE(result.outcome == StabilityOutcome::Timeout);
    REQUIRE(result.waited_ms >= 1000);
    REQUIRE(probe.calls <= 12);
}

TEST_CASE("detector_reports_vanished_file") {
    ScriptedProbe probe({at(10, 1), FileSample{}});
    ManualClock clock;
    StabilityDetector detector(settings(2, 100, 1000), probe, clock);

    auto result = detector.wait_until_stable("/virtual/gone.raw");

    REQUIRE(result.outcome == StabilityOutcome::Vanished);
}

TEST_CASE("detector_waits_while_file_is_locked") {
    ScriptedProbe probe({at(10, 1)});
    probe.exclusive = false;
    ManualClock clock;
    StabilityDetector detector(settings(2, 100, 500), probe, clock);

    auto result = detector.wait_until_stable("/virtual/locked.raw");

    REQUIRE(result.outcome == StabilityOutcome::Timeout);
}

TEST_CASE("detector_stops_when_sleep_is_cancelled") {
    ScriptedProbe probe({at(1, 1), at(2, 2), at(3, 3)});
    ManualClock clock;
    clock.cancel_after = 1;
    StabilityDetector detector(settings(2, 100, 10000), probe, clock);

    auto result = detector.wait_until_stable("/virtual/file.raw");

    REQUIRE(result.outcome == StabilityOutcome::Cancelled);
    REQUIRE(result.samples_taken == 2);
}

TEST_CASE("posix_probe_samples_real_file") {
    hirespipe::test::TempDir dir;
    const auto p = dir / "sample.bin";
    hirespipe::test::write_file(p, "12345");

    hirespipe::pipeline::PosixFileProbe probe;
    auto s = probe.sample(p);
    REQUIRE(s.exists);
    REQUIRE(s.size == 5);
    REQUIRE(probe.can_open_exclusive(p));

    auto missing = probe.sample(dir / "missing.bin");
    REQUIRE_FALSE(missing.exists);
    REQUIRE_FALSE(probe.can_open_exclusive(dir / "missing.bin"));
}
