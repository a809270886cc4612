#include "hirespipe/pipeline/stability.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hirespipe::pipeline {

bool evaluate_stability(const std::vector<FileSample>& samples, int required) {
    if (required < kMinStabilitySamples) required = kMinStabilitySamples;
    if (samples.size() < static_cast<size_t>(required)) {
        return false;
    }
    const size_t first = samples.size() - static_cast<size_t>(required);
    const FileSample& ref = samples.back();
    if (!ref.exists) {
        return false;
    }
    for (size_t i = first; i < samples.size(); ++i) {
        if (samples[i] != ref) {
            return false;
        }
    }
    return true;
}

FileSample PosixFileProbe::sample(const fs::path& path) {
    FileSample s;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return s;
    }
    s.exists = true;
    s.size = static_cast<uint64_t>(st.st_size);
    s.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                 static_cast<int64_t>(st.st_mtim.tv_nsec);
    return s;
}

bool PosixFileProbe::can_open_exclusive(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = ::flock(fd, LOCK_EX | LOCK_NB) == 0;
    if (ok) {
        ::flock(fd, LOCK_UN);
    }
    ::close(fd);
    return ok;
}

StabilityDetector::StabilityDetector(StabilitySettings settings, FileProbe& probe, Clock& clock)
    : settings_(settings), probe_(probe), clock_(clock) {
    if (settings_.required_samples < kMinStabilitySamples) {
        settings_.required_samples = kMinStabilitySamples;
    }
}

StabilityResult StabilityDetector::wait_until_stable(const fs::path& path) const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    StabilityResult result;
    std::vector<FileSample> window;
    const auto start = clock_.now();
    const size_t keep = static_cast<size_t>(settings_.required_samples);

    while (true) {
        FileSample s = probe_.sample(path);
        ++result.samples_taken;
        result.last = s;
        result.waited_ms = duration_cast<milliseconds>(clock_.now() - start).count();

        if (!s.exists) {
            result.outcome = StabilityOutcome::Vanished;
            return result;
        }

        window.push_back(s);
        if (window.size() > keep) {
            window.erase(window.begin());
        }

        if (evaluate_stability(window, settings_.required_samples) &&
            probe_.can_open_exclusive(path)) {
            result.outcome = StabilityOutcome::Stable;
            return result;
        }

        if (clock_.now() - start >= settings_.timeout) {
            result.outcome = StabilityOutcome::Timeout;
            return result;
        }

        if (!clock_.sleep_for(settings_.poll_interval)) {
            result.outcome = StabilityOutcome::Cancelled;
            return result;
        }
    }
}

} // namespace hirespipe::pipeline
