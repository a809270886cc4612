#pragma once

#include "hirespipe/config/configuration.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace hirespipe::test {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("hirespipe_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)) + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& content) {
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void write_bytes(const fs::path& p, const std::vector<uint8_t>& bytes) {
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::vector<uint8_t> pattern_bytes(size_t n, uint32_t seed) {
    std::vector<uint8_t> out(n);
    std::mt19937 gen(seed);
    for (auto& b : out) {
        b = static_cast<uint8_t>(gen() & 0xFF);
    }
    return out;
}

// Short intervals so pipeline tests finish in well under a second per file.
inline config::Config fast_config(const fs::path& source, const fs::path& dest) {
    config::Config cfg;
    cfg.source_dir = source.string();
    cfg.dest_dir = dest.string();
    cfg.watch_poll_interval_ms = 20;
    cfg.source_wait_timeout_ms = 200;
    cfg.stability_poll_interval_ms = 20;
    cfg.stability_required_samples = 2;
    cfg.stability_timeout_ms = 2000;
    cfg.worker_count = 2;
    cfg.queue_capacity = 8;
    cfg.max_retries = 3;
    cfg.retry_base_delay_ms = 1;
    cfg.retry_backoff_factor = 2.0;
    cfg.retry_max_delay_ms = 10;
    cfg.fsync_on_delivery = false;
    return cfg;
}

} // namespace hirespipe::test
