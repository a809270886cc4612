#include "hirespipe/core/events.hpp"
#include "hirespipe/core/shutdown.hpp"
#include "hirespipe/pipeline/ledger.hpp"
#include "hirespipe/pipeline/watcher.hpp"
#include "hirespipe/pipeline/work_queue.hpp"
#include "hirespipe/pipeline/stability.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <set>
#include <sstream>
#include <thread>

using namespace hirespipe;
using hirespipe::test::TempDir;
using hirespipe::test::write_file;

namespace {

struct WatcherFixture {
    TempDir source;
    TempDir state;
    std::ostringstream log;
    core::EventEmitter events{log, "test"};
    core::ShutdownSignal signal;
    pipeline::WorkQueue queue{64};
    std::unique_ptr<pipeline::Ledger> ledger = pipeline::Ledger::open(state / "ledger.jsonl");

    pipeline::WatcherSettings settings(bool recursive = false) {
        pipeline::WatcherSettings ws;
        ws.source_dir = source.path();
        ws.recursive = recursive;
        ws.poll_interval = std::chrono::milliseconds(10);
        return ws;
    }

    std::set<std::string> drain() {
        std::set<std::string> names;
        while (queue.size() > 0) {
            auto job = queue.dequeue();
            names.insert(job->relative_path.string());
            queue.complete(job->source_path);
        }
        return names;
    }
};

} // namespace

TEST_CASE("watcher_enqueues_new_files_once") {
    WatcherFixture f;
    write_file(f.source / "a.raw", "a");
    write_file(f.source / "b.raw", "b");
    pipeline::Watcher watcher(f.settings(), f.queue, *f.ledger, f.events, f.signal);

    REQUIRE(watcher.scan_once() == 2);
    REQUIRE(f.drain() == std::set<std::string>{"a.raw", "b.raw"});

    // Unchanged files are not offered again.
    REQUIRE(watcher.scan_once() == 0);
    REQUIRE(watcher.stats().enqueued == 2);
}

TEST_CASE("watcher_reoffers_file_whose_signature_changed") {
    WatcherFixture f;
    write_file(f.source / "a.raw", "a");
    pipeline::Watcher watcher(f.settings(), f.queue, *f.ledger, f.events, f.signal);
    REQUIRE(watcher.scan_once() == 1);
    f.drain();

    write_file(f.source / "a.raw", "rewritten");
    REQUIRE(watcher.scan_once() == 1);
}

TEST_CASE("watcher_ignores_hidden_temp_and_filtered_files") {
    WatcherFixture f;
    write_file(f.source / "keep.RAW", "x");
    write_file(f.source / "skip.jpg", "x");
    write_file(f.source / ".hidden.raw", "x");
    write_file(f.source / ".hirespipe-keep.raw.1.0.tmp", "x");
    auto ws = f.settings();
    ws.extensions = {"raw"};
    pipeline::Watcher watcher(ws, f.queue, *f.ledger, f.events, f.signal);

    REQUIRE(watcher.scan_once() == 1);
    REQUIRE(f.drain() == std::set<std::string>{"keep.RAW"});
}

TEST_CASE("watcher_recursion_is_configurable") {
    WatcherFixture f;
    write_file(f.source / "top.raw", "x");
    write_file(f.source.path() / "night1" / "deep.raw", "x");

    SECTION("flat") {
        pipeline::Watcher watcher(f.settings(false), f.queue, *f.ledger, f.events, f.signal);
        REQUIRE(watcher.scan_once() == 1);
        REQUIRE(f.drain() == std::set<std::string>{"top.raw"});
    }
    SECTION("recursive") {
        pipeline::Watcher watcher(f.settings(true), f.queue, *f.ledger, f.events, f.signal);
        REQUIRE(watcher.scan_once() == 2);
        REQUIRE(f.drain() == std::set<std::string>{"top.raw", "night1/deep.raw"});
    }
}

TEST_CASE("watcher_skips_files_already_in_ledger") {
    WatcherFixture f;
    const auto path = f.source / "done.raw";
    write_file(path, "done");
    auto sample = pipeline::PosixFileProbe().sample(path);

    pipeline::LedgerEntry entry;
    entry.source_path = path.string();
    entry.fingerprint = "fp";
    entry.source_size = sample.size;
    entry.source_mtime_ns = sample.mtime_ns;
    f.ledger->append(entry);

    pipeline::Watcher watcher(f.settings(), f.queue, *f.ledger, f.events, f.signal);
    REQUIRE(watcher.scan_once() == 0);
    REQUIRE(watcher.stats().already_delivered == 1);
}

TEST_CASE("watcher_tolerates_missing_source_directory") {
    WatcherFixture f;
    auto ws = f.settings();
    ws.source_dir = f.source.path() / "not_yet";
    pipeline::Watcher watcher(ws, f.queue, *f.ledger, f.events, f.signal);

    REQUIRE(watcher.scan_once() == 0);
    REQUIRE(watcher.stats().scan_errors == 1);
    REQUIRE_FALSE(watcher.wait_for_source(std::chrono::milliseconds(30)));

    std::thread creator([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        std::filesystem::create_directories(ws.source_dir);
    });
    REQUIRE(watcher.wait_for_source(std::chrono::seconds(5)));
    creator.join();

    write_file(ws.source_dir / "late.raw", "x");
    REQUIRE(watcher.scan_once() == 1);
}

TEST_CASE("watcher_thread_stops_on_shutdown_signal") {
    WatcherFixture f;
    pipeline::Watcher watcher(f.settings(), f.queue, *f.ledger, f.events, f.signal);
    watcher.start();

    write_file(f.source / "arrives.raw", "x");
    for (int i = 0; i < 200 && f.queue.size() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(f.queue.size() == 1);

    f.signal.request();
    watcher.stop();
    REQUIRE(watcher.stats().scans >= 1);
}

TEST_CASE("watcher_settled_signature_is_not_offered_again") {
    WatcherFixture f;
    const auto path = f.source / "grown.raw";
    write_file(path, "part");
    pipeline::Watcher watcher(f.settings(), f.queue, *f.ledger, f.events, f.signal);
    REQUIRE(watcher.scan_once() == 1);

    // The job ran on the finished file and failed; record what it saw.
    write_file(path, "part and the rest");
    auto final_sample = pipeline::PosixFileProbe().sample(path);
    watcher.settle(path, final_sample.size, final_sample.mtime_ns);
    f.drain();

    REQUIRE(watcher.scan_once() == 0);

    write_file(path, "rewritten by the user");
    REQUIRE(watcher.scan_once() == 1);
}
