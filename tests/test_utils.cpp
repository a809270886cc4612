#include "hirespipe/core/errors.hpp"
#include "hirespipe/core/events.hpp"
#include "hirespipe/core/shutdown.hpp"
#include "hirespipe/core/utils.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>

namespace core = hirespipe::core;

TEST_CASE("sha256_matches_known_vectors") {
    REQUIRE(core::sha256_bytes({}) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    const std::string abc = "abc";
    REQUIRE(core::sha256_bytes(std::vector<uint8_t>(abc.begin(), abc.end())) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("sha256_file_equals_sha256_of_contents") {
    hirespipe::test::TempDir dir;
    const auto bytes = hirespipe::test::pattern_bytes(200000, 5);
    hirespipe::test::write_bytes(dir / "data.bin", bytes);

    REQUIRE(core::sha256_file(dir / "data.bin") == core::sha256_bytes(bytes));
    REQUIRE_THROWS_AS(core::sha256_file(dir / "missing.bin"), hirespipe::IOError);
}

TEST_CASE("read_bytes_missing_file_throws") {
    REQUIRE_THROWS_AS(core::read_bytes("/nonexistent/file.raw"), hirespipe::IOError);
}

TEST_CASE("format_bytes_uses_binary_units") {
    REQUIRE(core::format_bytes(512) == "512 B");
    REQUIRE(core::format_bytes(10 * 1024 * 1024) == "10.00 MiB");
}

TEST_CASE("string_helpers") {
    REQUIRE(core::to_lower("PHOTO.RAW") == "photo.raw");
    REQUIRE(core::ends_with("photo.raw", ".raw"));
    REQUIRE_FALSE(core::ends_with("raw", "photo.raw"));
    REQUIRE(core::starts_with(".hirespipe-x", ".hirespipe-"));
    REQUIRE(core::shell_quote("a b") == "'a b'");
}

TEST_CASE("utf8_check_and_hex_round_trip") {
    REQUIRE(core::is_valid_utf8("photo_12.raw"));
    REQUIRE(core::is_valid_utf8("caf\xc3\xa9.raw"));
    REQUIRE_FALSE(core::is_valid_utf8("caf\xe9.raw"));
    REQUIRE_FALSE(core::is_valid_utf8("\xc0\xaf"));

    const std::string raw = "caf\xe9";
    REQUIRE(core::hex_encode(raw) == "636166e9");
    REQUIRE(core::hex_decode("636166E9") == raw);
    REQUIRE_THROWS_AS(core::hex_decode("abc"), hirespipe::ValidationError);
    REQUIRE_THROWS_AS(core::hex_decode("zz"), hirespipe::ValidationError);
}

TEST_CASE("shutdown_signal_interrupts_wait") {
    core::ShutdownSignal signal;
    REQUIRE(signal.wait_for(std::chrono::milliseconds(1)));

    std::atomic<int> callbacks{0};
    signal.on_request([&] { ++callbacks; });

    const auto start = std::chrono::steady_clock::now();
    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        signal.request();
    });
    const bool completed = signal.wait_for(std::chrono::seconds(10));
    stopper.join();

    REQUIRE_FALSE(completed);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(signal.requested());
    REQUIRE(callbacks.load() == 1);

    signal.request();
    REQUIRE(callbacks.load() == 1);
}

TEST_CASE("event_emitter_writes_json_lines_with_run_id") {
    std::ostringstream out;
    core::EventEmitter emitter(out, "run-1");
    hirespipe::Job job;
    job.source_path = "/in/photo_12.raw";

    emitter.run_start({{"workers", 2}});
    emitter.job_state(job, hirespipe::JobState::Discovered, hirespipe::JobState::Stabilizing);

    std::istringstream in(out.str());
    std::string line;
    std::vector<core::json> events;
    while (std::getline(in, line)) {
        events.push_back(core::json::parse(line));
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0]["type"] == "run_start");
    REQUIRE(events[0]["run_id"] == "run-1");
    REQUIRE(events[0]["workers"] == 2);
    REQUIRE(events[1]["type"] == "job_state");
    REQUIRE(events[1]["from"] == "Discovered");
    REQUIRE(events[1]["to"] == "Stabilizing");
    REQUIRE(events[1].contains("ts"));
}

TEST_CASE("event_emitter_job_events_carry_job_fields") {
    std::ostringstream out;
    core::EventEmitter emitter(out, "run-2");
    hirespipe::Job job;
    job.source_path = "/in/caf\xe9.raw";
    job.dest_path = "/out/caf\xe9.raw";
    job.size_snapshot = 42;
    job.attempt_count = 2;

    REQUIRE_NOTHROW(emitter.job_retry(job, 100, "busy"));
    REQUIRE_NOTHROW(emitter.job_delivered(job, 0.5));
    REQUIRE_NOTHROW(emitter.job_failed(job, 0.5));

    std::istringstream in(out.str());
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        auto event = core::json::parse(line);
        REQUIRE(event["size"] == 42);
        REQUIRE(event["attempt"] == 2);
        REQUIRE(event["source_path"].get<std::string>().rfind("/in/caf", 0) == 0);
        ++count;
    }
    REQUIRE(count == 3);
}
