#include "hirespipe/pipeline/atomic_delivery.hpp"

#include "hirespipe/core/errors.hpp"
#include "hirespipe/core/utils.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hirespipe::pipeline {

namespace {

const std::string kTempPrefix = ".hirespipe-";
const std::string kTempSuffix = ".tmp";

std::atomic<unsigned long> g_temp_seq{0};

std::string errno_text(const std::string& what, const fs::path& p) {
    return what + " " + p.string() + ": " + std::strerror(errno);
}

void write_all(int fd, const uint8_t* data, size_t n, const fs::path& p) {
    size_t written = 0;
    while (written < n) {
        ssize_t w = ::write(fd, data + written, n - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw DeliveryFailure(errno_text("write failed for", p));
        }
        written += static_cast<size_t>(w);
    }
}

void fsync_directory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw DeliveryFailure(errno_text("cannot open directory", dir));
    }
    int rc = ::fsync(fd);
    int saved = errno;
    ::close(fd);
    if (rc != 0) {
        errno = saved;
        throw DeliveryFailure(errno_text("fsync failed for directory", dir));
    }
}

// Temp names embed the writer's pid: .hirespipe-<name>.<pid>.<seq>.tmp
bool temp_owner_alive(const std::string& filename) {
    std::string body = filename.substr(0, filename.size() - kTempSuffix.size());
    size_t seq_dot = body.rfind('.');
    if (seq_dot == std::string::npos || seq_dot == 0) return false;
    size_t pid_dot = body.rfind('.', seq_dot - 1);
    if (pid_dot == std::string::npos) return false;
    std::string pid_str = body.substr(pid_dot + 1, seq_dot - pid_dot - 1);
    if (pid_str.empty() || pid_str.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    pid_t pid = static_cast<pid_t>(std::stol(pid_str));
    if (pid <= 0) return false;
    if (pid == ::getpid()) return true;
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace

AtomicDelivery::AtomicDelivery(fs::path dest_root, bool overwrite_existing, bool fsync_enabled)
    : dest_root_(std::move(dest_root)),
      overwrite_existing_(overwrite_existing),
      fsync_enabled_(fsync_enabled) {}

bool AtomicDelivery::is_temp_name(const std::string& filename) {
    return filename.size() > kTempPrefix.size() + kTempSuffix.size() &&
           core::starts_with(filename, kTempPrefix) && core::ends_with(filename, kTempSuffix);
}

fs::path AtomicDelivery::make_temp_path(const fs::path& final_path) {
    std::string name = kTempPrefix + final_path.filename().string() + "." +
                       std::to_string(::getpid()) + "." +
                       std::to_string(g_temp_seq.fetch_add(1)) + kTempSuffix;
    return final_path.parent_path() / name;
}

DeliveryOutcome AtomicDelivery::deliver(const std::vector<uint8_t>& bytes,
                                        const fs::path& final_path) {
    const fs::path dir = final_path.parent_path();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw DeliveryFailure("cannot create " + dir.string() + ": " + ec.message());
    }

    if (!overwrite_existing_ && fs::exists(final_path, ec)) {
        return DeliveryOutcome::SkippedExisting;
    }

    const fs::path tmp = make_temp_path(final_path);
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw DeliveryFailure(errno_text("cannot create temp file", tmp));
    }

    try {
        write_all(fd, bytes.data(), bytes.size(), tmp);
        if (fsync_enabled_ && ::fsync(fd) != 0) {
            throw DeliveryFailure(errno_text("fsync failed for", tmp));
        }
        if (::close(fd) != 0) {
            fd = -1;
            throw DeliveryFailure(errno_text("close failed for", tmp));
        }
        fd = -1;

        DeliveryOutcome outcome = DeliveryOutcome::Delivered;
        if (overwrite_existing_) {
            if (::rename(tmp.c_str(), final_path.c_str()) != 0) {
                throw DeliveryFailure(errno_text("rename failed onto", final_path));
            }
        } else {
            // link(2) refuses to replace, so a concurrent writer's file is never clobbered.
            if (::link(tmp.c_str(), final_path.c_str()) != 0) {
                if (errno != EEXIST) {
                    throw DeliveryFailure(errno_text("link failed onto", final_path));
                }
                outcome = DeliveryOutcome::SkippedExisting;
            }
            ::unlink(tmp.c_str());
        }

        if (fsync_enabled_ && outcome == DeliveryOutcome::Delivered) {
            fsync_directory(dir);
        }
        return outcome;
    } catch (...) {
        if (fd >= 0) {
            ::close(fd);
        }
        fs::remove(tmp, ec);
        throw;
    }
}

size_t AtomicDelivery::sweep_stale_temp_files() {
    std::error_code ec;
    if (!fs::is_directory(dest_root_, ec)) {
        return 0;
    }

    size_t removed = 0;
    fs::recursive_directory_iterator it(
        dest_root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[DELIVERY] Cannot scan " << dest_root_ << ": " << ec.message() << std::endl;
        return 0;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[DELIVERY] Scan error: " << ec.message() << std::endl;
            break;
        }
        const std::string name = it->path().filename().string();
        if (!it->is_regular_file(ec) || !is_temp_name(name)) {
            continue;
        }
        if (temp_owner_alive(name)) {
            continue;
        }
        if (fs::remove(it->path(), ec)) {
            ++removed;
        } else if (ec) {
            std::cerr << "[DELIVERY] Cannot remove stale temp " << it->path() << ": "
                      << ec.message() << std::endl;
        }
    }
    return removed;
}

} // namespace hirespipe::pipeline
