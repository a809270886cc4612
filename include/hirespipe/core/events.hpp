#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <ostream>
#include <string>

namespace hirespipe::core {

using json = nlohmann::json;

/**
 * JSON-lines event stream for one runner instance.
 * Every event carries type, run_id and an ISO-8601 ts field. Safe to call
 * from the watcher and all workers concurrently.
 */
class EventEmitter {
public:
    EventEmitter(std::ostream& out, std::string run_id);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());
    void stop_requested(const std::string& reason);

    void job_discovered(const Job& job);
    void job_state(const Job& job, JobState from, JobState to);
    void job_retry(const Job& job, long long delay_ms, const std::string& message);
    void job_delivered(const Job& job, double duration_s);
    void job_duplicate(const Job& job, const std::string& reason);
    void job_failed(const Job& job, double duration_s);

    void warning(const std::string& message, const json& extra = json::object());
    void error(const std::string& message, const json& extra = json::object());

    void emit(const std::string& type, const json& data);

private:
    json base_event(const std::string& type) const;
    void write(const json& event);

    std::ostream& out_;
    std::string run_id_;
    std::mutex mutex_;
};

} // namespace hirespipe::core
