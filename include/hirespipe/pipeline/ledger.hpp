#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hirespipe::pipeline {

namespace fs = std::filesystem;

struct LedgerEntry {
    std::string source_path;
    std::string fingerprint;        // sha256 of the source bytes
    std::string destination_path;
    std::string completed_at;       // ISO-8601 UTC
    uint64_t source_size = 0;
    int64_t source_mtime_ns = 0;

    nlohmann::json to_json() const;
    static LedgerEntry from_json(const nlohmann::json& j);
};

/**
 * Append-only JSON-lines record of delivered files.
 *
 * The whole file is read once at open() to rebuild the processed set. Each
 * append() is one write(2) of a complete line to an O_APPEND descriptor
 * under an exclusive flock, followed by fsync, so concurrent runners on the
 * same ledger never interleave records. Entries are never rewritten.
 */
class Ledger {
public:
    ~Ledger();

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // Creates the file (and its directory) if missing. Throws IOError if it
    // cannot be opened for appending. A torn final line is skipped.
    static std::unique_ptr<Ledger> open(const fs::path& path);

    // Loads without creating, locking or repairing anything. A missing file
    // gives an empty ledger; append() on the result throws.
    static std::unique_ptr<Ledger> open_read_only(const fs::path& path);

    // Throws LedgerWriteFailure; the caller must treat that as fatal.
    void append(const LedgerEntry& entry);

    bool contains(const std::string& source_path, const std::string& fingerprint) const;
    std::optional<LedgerEntry> find(const std::string& source_path) const;

    // Latest entry for the path was recorded with this size and mtime.
    bool matches_signature(const std::string& source_path, uint64_t size, int64_t mtime_ns) const;

    // Newest last, at most `limit` entries (0 = all).
    std::vector<LedgerEntry> recent(size_t limit) const;

    size_t size() const;
    size_t skipped_lines() const { return skipped_lines_; }
    const fs::path& path() const { return path_; }

private:
    Ledger(fs::path path, int fd);
    bool load();   // true if the last record is unterminated
    void index(const LedgerEntry& entry);

    fs::path path_;
    int fd_ = -1;
    size_t skipped_lines_ = 0;
    mutable std::mutex mutex_;
    std::vector<LedgerEntry> entries_;
    std::unordered_map<std::string, size_t> latest_;   // source_path -> index into entries_
    std::unordered_set<std::string> keys_;             // source_path + '\n' + fingerprint
};

} // namespace hirespipe::pipeline
