#include "hirespipe/core/events.hpp"
#include "hirespipe/core/utils.hpp"

#include <utility>

namespace hirespipe::core {

namespace {

json job_fields(const Job& job) {
    return {
        {"source_path", job.source_path.string()},
        {"size", job.size_snapshot},
        {"attempt", job.attempt_count},
        {"state", job_state_to_string(job.state)}
    };
}

} // namespace

EventEmitter::EventEmitter(std::ostream& out, std::string run_id)
    : out_(out), run_id_(std::move(run_id)) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::write(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Paths are raw bytes; invalid UTF-8 is replaced rather than thrown on.
    out_ << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out_.flush();
}

void EventEmitter::emit(const std::string& type, const json& data) {
    json event = base_event(type);
    if (data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }
    write(event);
}

void EventEmitter::run_start(const json& extra) {
    emit("run_start", extra);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::stop_requested(const std::string& reason) {
    json event = base_event("run_stop_requested");
    event["reason"] = reason;
    write(event);
}

void EventEmitter::job_discovered(const Job& job) {
    json event = base_event("job_discovered");
    event["source_path"] = job.source_path.string();
    event["size"] = job.size_snapshot;
    event["discovered_at"] = format_iso_timestamp(job.discovered_at);
    write(event);
}

void EventEmitter::job_state(const Job& job, JobState from, JobState to) {
    json event = base_event("job_state");
    event["source_path"] = job.source_path.string();
    event["from"] = job_state_to_string(from);
    event["to"] = job_state_to_string(to);
    event["attempt"] = job.attempt_count;
    write(event);
}

void EventEmitter::job_retry(const Job& job, long long delay_ms, const std::string& message) {
    json event = base_event("job_retry");
    event.update(job_fields(job));
    event["delay_ms"] = delay_ms;
    event["message"] = message;
    write(event);
}

void EventEmitter::job_delivered(const Job& job, double duration_s) {
    json event = base_event("job_delivered");
    event.update(job_fields(job));
    event["dest_path"] = job.dest_path.string();
    event["fingerprint"] = job.fingerprint;
    event["duration_s"] = duration_s;
    write(event);
}

void EventEmitter::job_duplicate(const Job& job, const std::string& reason) {
    json event = base_event("job_duplicate");
    event["source_path"] = job.source_path.string();
    event["dest_path"] = job.dest_path.string();
    event["reason"] = reason;
    write(event);
}

void EventEmitter::job_failed(const Job& job, double duration_s) {
    json event = base_event("job_failed");
    event.update(job_fields(job));
    event["reason"] = failure_reason_to_string(job.failure);
    event["error"] = job.last_error;
    event["duration_s"] = duration_s;
    write(event);
}

void EventEmitter::warning(const std::string& message, const json& extra) {
    json event = base_event("warning");
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::error(const std::string& message, const json& extra) {
    json event = base_event("error");
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

} // namespace hirespipe::core
