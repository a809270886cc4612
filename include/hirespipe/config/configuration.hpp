#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace hirespipe::config {

namespace fs = std::filesystem;

struct Config {
  // Directories
  std::string source_dir;
  std::string dest_dir;
  std::string ledger_path;   // empty = <dest_dir>/.hirespipe-ledger.jsonl
  std::string log_dir;       // empty = <dest_dir>/.hirespipe-logs
  bool recursive = false;
  std::vector<std::string> extensions; // empty = accept every regular file

  // Watcher
  int watch_poll_interval_ms = 1000;
  int source_wait_timeout_ms = 30000;

  // Stability
  int stability_poll_interval_ms = 500;
  int stability_required_samples = 2;
  int stability_timeout_ms = 60000;

  // Workers / queue
  int worker_count = 2;
  int queue_capacity = 64;

  // Retry
  int max_retries = 5;
  int retry_base_delay_ms = 1000;
  double retry_backoff_factor = 2.0;
  int retry_max_delay_ms = 30000;

  // Delivery
  bool overwrite_existing = false;
  bool fsync_on_delivery = true;
  bool delete_source_on_success = false;
  std::string output_suffix;

  // Transform
  std::string transform = "passthrough"; // passthrough | command
  std::string transform_command;         // shell template with {input} and {output}

  bool history_file = true;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  fs::path effective_ledger_path() const;
  fs::path effective_log_dir() const;
};

} // namespace hirespipe::config
