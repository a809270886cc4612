#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hirespipe::pipeline {

namespace fs = std::filesystem;

enum class DeliveryOutcome {
    Delivered,
    SkippedExisting   // final path already present and overwrite disabled
};

inline std::string delivery_outcome_to_string(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::Delivered: return "delivered";
        case DeliveryOutcome::SkippedExisting: return "skipped_existing";
        default: return "unknown";
    }
}

/**
 * Publishes bytes at a final path inside dest_root without ever exposing a
 * partial file there.
 *
 * Bytes go to a uniquely named hidden temp file in the final path's own
 * directory, are flushed (fsync when enabled), then published in one step:
 * link(2) when overwrite is disabled, so an existing file wins even against
 * another process, and rename(2) when it is enabled. The directory entry is
 * fsynced afterwards. Any failure throws DeliveryFailure and leaves no temp
 * file behind.
 */
class AtomicDelivery {
public:
    AtomicDelivery(fs::path dest_root, bool overwrite_existing, bool fsync_enabled = true);

    DeliveryOutcome deliver(const std::vector<uint8_t>& bytes, const fs::path& final_path);

    // Removes temp files left by a crashed run. Returns the number removed.
    size_t sweep_stale_temp_files();

    static bool is_temp_name(const std::string& filename);

    const fs::path& dest_root() const { return dest_root_; }
    bool overwrite_existing() const { return overwrite_existing_; }

private:
    fs::path make_temp_path(const fs::path& final_path);

    fs::path dest_root_;
    bool overwrite_existing_;
    bool fsync_enabled_;
};

} // namespace hirespipe::pipeline
