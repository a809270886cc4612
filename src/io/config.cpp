#include "hirespipe/config/configuration.hpp"
#include "hirespipe/core/errors.hpp"
#include "hirespipe/pipeline/stability.hpp"

#include <fstream>

namespace hirespipe::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (!n) return;
    if (!n.IsSequence()) {
        throw ConfigError("extensions must be a list");
    }
    out.clear();
    for (const auto& item : n) {
        out.push_back(item.as<std::string>());
    }
}

static fs::path comparable_dir(const std::string& dir) {
    fs::path p = fs::weakly_canonical(fs::absolute(dir)).lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

static bool is_within(const fs::path& inner, const fs::path& outer) {
    auto it = inner.begin();
    for (const auto& part : outer) {
        if (it == inner.end() || *it != part) {
            return false;
        }
        ++it;
    }
    return true;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top-level YAML node must be a mapping");
    }

    try {
        if (node["sourceDir"]) cfg.source_dir = node["sourceDir"].as<std::string>();
        if (node["destDir"]) cfg.dest_dir = node["destDir"].as<std::string>();
        if (node["ledgerPath"]) cfg.ledger_path = node["ledgerPath"].as<std::string>();
        if (node["logDir"]) cfg.log_dir = node["logDir"].as<std::string>();
        if (node["recursive"]) cfg.recursive = node["recursive"].as<bool>();
        read_string_list(node["extensions"], cfg.extensions);

        if (node["watchPollIntervalMs"]) cfg.watch_poll_interval_ms = node["watchPollIntervalMs"].as<int>();
        if (node["sourceWaitTimeoutMs"]) cfg.source_wait_timeout_ms = node["sourceWaitTimeoutMs"].as<int>();

        if (node["stabilityPollIntervalMs"]) {
            cfg.stability_poll_interval_ms = node["stabilityPollIntervalMs"].as<int>();
        }
        if (node["stabilityRequiredSamples"]) {
            cfg.stability_required_samples = node["stabilityRequiredSamples"].as<int>();
        }
        if (node["stabilityTimeoutMs"]) cfg.stability_timeout_ms = node["stabilityTimeoutMs"].as<int>();

        if (node["workerCount"]) cfg.worker_count = node["workerCount"].as<int>();
        if (node["queueCapacity"]) cfg.queue_capacity = node["queueCapacity"].as<int>();

        if (node["maxRetries"]) cfg.max_retries = node["maxRetries"].as<int>();
        if (node["retryBaseDelayMs"]) cfg.retry_base_delay_ms = node["retryBaseDelayMs"].as<int>();
        if (node["retryBackoffFactor"]) cfg.retry_backoff_factor = node["retryBackoffFactor"].as<double>();
        if (node["retryMaxDelayMs"]) cfg.retry_max_delay_ms = node["retryMaxDelayMs"].as<int>();

        if (node["overwriteExisting"]) cfg.overwrite_existing = node["overwriteExisting"].as<bool>();
        if (node["fsyncOnDelivery"]) cfg.fsync_on_delivery = node["fsyncOnDelivery"].as<bool>();
        if (node["deleteSourceOnSuccess"]) {
            cfg.delete_source_on_success = node["deleteSourceOnSuccess"].as<bool>();
        }
        if (node["outputSuffix"]) cfg.output_suffix = node["outputSuffix"].as<std::string>();

        if (node["transform"]) cfg.transform = node["transform"].as<std::string>();
        if (node["transformCommand"]) cfg.transform_command = node["transformCommand"].as<std::string>();

        if (node["historyFile"]) cfg.history_file = node["historyFile"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["sourceDir"] = source_dir;
    node["destDir"] = dest_dir;
    node["ledgerPath"] = ledger_path;
    node["logDir"] = log_dir;
    node["recursive"] = recursive;
    node["extensions"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& ext : extensions) {
        node["extensions"].push_back(ext);
    }

    node["watchPollIntervalMs"] = watch_poll_interval_ms;
    node["sourceWaitTimeoutMs"] = source_wait_timeout_ms;

    node["stabilityPollIntervalMs"] = stability_poll_interval_ms;
    node["stabilityRequiredSamples"] = stability_required_samples;
    node["stabilityTimeoutMs"] = stability_timeout_ms;

    node["workerCount"] = worker_count;
    node["queueCapacity"] = queue_capacity;

    node["maxRetries"] = max_retries;
    node["retryBaseDelayMs"] = retry_base_delay_ms;
    node["retryBackoffFactor"] = retry_backoff_factor;
    node["retryMaxDelayMs"] = retry_max_delay_ms;

    node["overwriteExisting"] = overwrite_existing;
    node["fsyncOnDelivery"] = fsync_on_delivery;
    node["deleteSourceOnSuccess"] = delete_source_on_success;
    node["outputSuffix"] = output_suffix;

    node["transform"] = transform;
    node["transformCommand"] = transform_command;

    node["historyFile"] = history_file;

    return node;
}

void Config::validate() const {
    if (source_dir.empty()) {
        throw ValidationError("sourceDir must be set");
    }
    if (dest_dir.empty()) {
        throw ValidationError("destDir must be set");
    }
    const fs::path source = comparable_dir(source_dir);
    const fs::path dest = comparable_dir(dest_dir);
    if (source == dest) {
        throw ValidationError("sourceDir and destDir must differ");
    }
    // A recursive scan would pick delivered files up again as new input.
    if (recursive && is_within(dest, source)) {
        throw ValidationError("destDir must not be inside sourceDir when recursive is set");
    }

    if (watch_poll_interval_ms <= 0) {
        throw ValidationError("watchPollIntervalMs must be > 0");
    }
    if (source_wait_timeout_ms < 0) {
        throw ValidationError("sourceWaitTimeoutMs must be >= 0");
    }

    if (stability_poll_interval_ms <= 0) {
        throw ValidationError("stabilityPollIntervalMs must be > 0");
    }
    if (stability_required_samples < pipeline::kMinStabilitySamples) {
        throw ValidationError("stabilityRequiredSamples must be >= " +
                              std::to_string(pipeline::kMinStabilitySamples));
    }
    if (stability_timeout_ms < stability_poll_interval_ms) {
        throw ValidationError("stabilityTimeoutMs must be >= stabilityPollIntervalMs");
    }

    if (worker_count < 1 || worker_count > 32) {
        throw ValidationError("workerCount must be between 1 and 32");
    }
    if (queue_capacity < 1) {
        throw ValidationError("queueCapacity must be >= 1");
    }

    if (max_retries < 1 || max_retries > 100) {
        throw ValidationError("maxRetries must be between 1 and 100");
    }
    if (retry_base_delay_ms < 0) {
        throw ValidationError("retryBaseDelayMs must be >= 0");
    }
    if (retry_backoff_factor < 1.0) {
        throw ValidationError("retryBackoffFactor must be >= 1");
    }
    if (retry_max_delay_ms < retry_base_delay_ms) {
        throw ValidationError("retryMaxDelayMs must be >= retryBaseDelayMs");
    }

    if (output_suffix.find('/') != std::string::npos) {
        throw ValidationError("outputSuffix must not contain '/'");
    }

    if (transform != "passthrough" && transform != "command") {
        throw ValidationError("transform must be 'passthrough' or 'command'");
    }
    if (transform == "command") {
        if (transform_command.find("{input}") == std::string::npos ||
            transform_command.find("{output}") == std::string::npos) {
            throw ValidationError("transformCommand must contain {input} and {output}");
        }
    }
}

fs::path Config::effective_ledger_path() const {
    if (!ledger_path.empty()) return fs::path(ledger_path);
    return fs::path(dest_dir) / ".hirespipe-ledger.jsonl";
}

fs::path Config::effective_log_dir() const {
    if (!log_dir.empty()) return fs::path(log_dir);
    return fs::path(dest_dir) / ".hirespipe-logs";
}

} // namespace hirespipe::config
