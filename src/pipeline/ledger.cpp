#include "hirespipe/pipeline/ledger.hpp"

#include "hirespipe/core/errors.hpp"
#include "hirespipe/core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace hirespipe::pipeline {

namespace {

std::string key_of(const std::string& source_path, const std::string& fingerprint) {
    return source_path + "\n" + fingerprint;
}

// Holds an exclusive flock for the lifetime of the object.
class FileLock {
public:
    explicit FileLock(int fd) : fd_(fd) {
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                throw LedgerWriteFailure(std::string("flock failed: ") + std::strerror(errno));
            }
        }
    }
    ~FileLock() { ::flock(fd_, LOCK_UN); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_;
};

void write_line(int fd, const std::string& line) {
    size_t written = 0;
    while (written < line.size()) {
        ssize_t w = ::write(fd, line.data() + written, line.size() - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw LedgerWriteFailure(std::string("write failed: ") + std::strerror(errno));
        }
        written += static_cast<size_t>(w);
    }
}

// Non-UTF-8 paths go under "<key>_hex" so they survive the round trip.
void put_path(nlohmann::json& j, const std::string& key, const std::string& path) {
    if (core::is_valid_utf8(path)) {
        j[key] = path;
    } else {
        j[key + "_hex"] = core::hex_encode(path);
    }
}

std::string get_path(const nlohmann::json& j, const std::string& key, bool required) {
    const std::string hex_key = key + "_hex";
    if (j.contains(hex_key)) {
        return core::hex_decode(j.at(hex_key).get<std::string>());
    }
    if (required) {
        return j.at(key).get<std::string>();
    }
    return j.value(key, std::string());
}

} // namespace

nlohmann::json LedgerEntry::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    put_path(j, "source_path", source_path);
    j["fingerprint"] = fingerprint;
    put_path(j, "destination_path", destination_path);
    j["completed_at"] = completed_at;
    j["source_size"] = source_size;
    j["source_mtime_ns"] = source_mtime_ns;
    return j;
}

LedgerEntry LedgerEntry::from_json(const nlohmann::json& j) {
    LedgerEntry e;
    e.source_path = get_path(j, "source_path", true);
    e.fingerprint = j.at("fingerprint").get<std::string>();
    e.destination_path = get_path(j, "destination_path", false);
    e.completed_at = j.value("completed_at", std::string());
    e.source_size = j.value("source_size", static_cast<uint64_t>(0));
    e.source_mtime_ns = j.value("source_mtime_ns", static_cast<int64_t>(0));
    return e;
}

Ledger::Ledger(fs::path path, int fd) : path_(std::move(path)), fd_(fd) {}

Ledger::~Ledger() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<Ledger> Ledger::open(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("cannot create ledger directory " + path.parent_path().string() +
                          ": " + ec.message());
        }
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw IOError("cannot open ledger " + path.string() + ": " + std::strerror(errno));
    }
    std::unique_ptr<Ledger> ledger(new Ledger(path, fd));
    const bool torn = ledger->load();

    // Terminate a torn record so the next append starts on a fresh line.
    if (torn) {
        try {
            FileLock lock(fd);
            write_line(fd, "\n");
        } catch (const LedgerWriteFailure& e) {
            throw IOError(std::string("cannot repair ledger tail: ") + e.what());
        }
    }

    return ledger;
}

std::unique_ptr<Ledger> Ledger::open_read_only(const fs::path& path) {
    std::unique_ptr<Ledger> ledger(new Ledger(path, -1));
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ledger;
    }
    ledger->load();
    return ledger;
}

bool Ledger::load() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw IOError("cannot read ledger " + path_.string());
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    size_t line_no = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        const bool terminated = nl != std::string::npos;
        std::string line = content.substr(pos, terminated ? nl - pos : std::string::npos);
        pos = terminated ? nl + 1 : content.size();
        ++line_no;
        if (line.empty()) continue;

        try {
            index(LedgerEntry::from_json(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            ++skipped_lines_;
            std::cerr << "[LEDGER] Skipping unreadable line " << line_no << " of " << path_
                      << (terminated ? "" : " (torn final record)") << ": " << e.what()
                      << std::endl;
        } catch (const ValidationError& e) {
            ++skipped_lines_;
            std::cerr << "[LEDGER] Skipping unreadable line " << line_no << " of " << path_
                      << ": " << e.what() << std::endl;
        }
    }
    return !content.empty() && content.back() != '\n';
}

void Ledger::index(const LedgerEntry& entry) {
    entries_.push_back(entry);
    latest_[entry.source_path] = entries_.size() - 1;
    keys_.insert(key_of(entry.source_path, entry.fingerprint));
}

void Ledger::append(const LedgerEntry& entry) {
    if (fd_ < 0) {
        throw LedgerWriteFailure("ledger " + path_.string() + " is open read-only");
    }
    const std::string line = entry.to_json().dump() + "\n";

    std::lock_guard<std::mutex> guard(mutex_);
    {
        FileLock lock(fd_);
        write_line(fd_, line);
        if (::fsync(fd_) != 0) {
            throw LedgerWriteFailure(std::string("fsync failed: ") + std::strerror(errno));
        }
    }
    index(entry);
}

bool Ledger::contains(const std::string& source_path, const std::string& fingerprint) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return keys_.count(key_of(source_path, fingerprint)) > 0;
}

std::optional<LedgerEntry> Ledger::find(const std::string& source_path) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = latest_.find(source_path);
    if (it == latest_.end()) {
        return std::nullopt;
    }
    return entries_[it->second];
}

bool Ledger::matches_signature(const std::string& source_path, uint64_t size,
                               int64_t mtime_ns) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = latest_.find(source_path);
    if (it == latest_.end()) {
        return false;
    }
    const LedgerEntry& e = entries_[it->second];
    return e.source_size == size && e.source_mtime_ns == mtime_ns;
}

std::vector<LedgerEntry> Ledger::recent(size_t limit) const {
    std::lock_guard<std::mutex> guard(mutex_);
    if (limit == 0 || limit >= entries_.size()) {
        return entries_;
    }
    return std::vector<LedgerEntry>(entries_.end() - static_cast<std::ptrdiff_t>(limit),
                                    entries_.end());
}

size_t Ledger::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}

} // namespace hirespipe::pipeline
