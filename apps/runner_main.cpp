#include "hirespipe/config/configuration.hpp"
#include "hirespipe/core/errors.hpp"
#include "hirespipe/core/events.hpp"
#include "hirespipe/core/shutdown.hpp"
#include "hirespipe/core/utils.hpp"
#include "hirespipe/pipeline/ledger.hpp"
#include "hirespipe/pipeline/orchestrator.hpp"
#include "hirespipe/pipeline/transform.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

namespace core = hirespipe::core;
namespace config = hirespipe::config;
namespace pipeline = hirespipe::pipeline;
namespace runner = hirespipe::runner;

constexpr int kExitUsage = 1;
constexpr int kExitStartup = 2;

volatile std::sig_atomic_t g_signal_received = 0;

extern "C" void handle_stop_signal(int signo) { g_signal_received = signo; }

void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = handle_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

// Forwards SIGINT/SIGTERM from the async handler into the shutdown signal.
class SignalForwarder {
public:
  SignalForwarder(core::ShutdownSignal &shutdown, core::EventEmitter &emitter)
      : thread_([this, &shutdown, &emitter] {
          while (!done_.load()) {
            const int signo = g_signal_received;
            if (signo != 0) {
              emitter.stop_requested(signo == SIGINT ? "SIGINT" : "SIGTERM");
              shutdown.request();
              return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
          }
        }) {}

  ~SignalForwarder() {
    done_.store(true);
    thread_.join();
  }

private:
  std::atomic<bool> done_{false};
  std::thread thread_;
};

std::optional<config::Config> load_config(const std::string &config_path) {
  try {
    config::Config cfg = config::Config::load(config_path);
    cfg.validate();
    return cfg;
  } catch (const hirespipe::HiresPipeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

int run_command(const std::string &config_path, bool once,
                const std::string &pid_file, const std::string &source_dir,
                const std::string &dest_dir) {
  config::Config cfg;
  try {
    cfg = config::Config::load(config_path);
    if (!source_dir.empty())
      cfg.source_dir = source_dir;
    if (!dest_dir.empty())
      cfg.dest_dir = dest_dir;
    cfg.validate();
  } catch (const hirespipe::HiresPipeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  std::unique_ptr<pipeline::TransformAdapter> transform;
  try {
    transform = pipeline::make_transform(cfg);
  } catch (const hirespipe::ConfigError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitUsage;
  }

  const fs::path log_dir = cfg.effective_log_dir();
  std::error_code ec;
  fs::create_directories(log_dir, ec);
  if (ec) {
    std::cerr << "Error: cannot create log directory " << log_dir << ": "
              << ec.message() << std::endl;
    return kExitStartup;
  }

  std::ofstream event_log_file(log_dir / "run_events.jsonl", std::ios::app);
  if (!event_log_file) {
    std::cerr << "Error: cannot open " << (log_dir / "run_events.jsonl")
              << std::endl;
    return kExitStartup;
  }
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter(log_file, run_id);
  core::ShutdownSignal shutdown;

  std::unique_ptr<runner::PidFile> pid_guard;
  if (!pid_file.empty()) {
    try {
      pid_guard = std::make_unique<runner::PidFile>(pid_file);
    } catch (const hirespipe::IOError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return kExitStartup;
    }
  }

  install_signal_handlers();
  SignalForwarder forwarder(shutdown, emitter);

  emitter.run_start({{"config_path", config_path},
                     {"source_dir", cfg.source_dir},
                     {"dest_dir", cfg.dest_dir},
                     {"ledger", cfg.effective_ledger_path().string()},
                     {"transform", transform->name()},
                     {"workers", cfg.worker_count},
                     {"once", once}});

  std::cerr << "[RUNNER] Run ID: " << run_id << std::endl;
  std::cerr << "[RUNNER] Watching " << cfg.source_dir << " -> " << cfg.dest_dir
            << std::endl;

  pipeline::PipelineOrchestrator orchestrator(cfg, *transform, emitter,
                                              shutdown);
  try {
    if (once) {
      orchestrator.run_once();
    } else {
      orchestrator.run();
    }
  } catch (const hirespipe::StopRequested &) {
    emitter.run_end(true, "stopped",
                    runner::stats_to_json(orchestrator.stats(),
                                          orchestrator.queue().size()));
    return 0;
  } catch (const hirespipe::StartupError &e) {
    emitter.error(e.what());
    emitter.run_end(false, "startup_failed");
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitStartup;
  }

  const int exit_code = orchestrator.exit_code();
  const std::string status = exit_code == 0
                                 ? (shutdown.requested() ? "stopped" : "ok")
                                 : "ledger_failure";
  emitter.run_end(exit_code == 0, status,
                  runner::stats_to_json(orchestrator.stats(),
                                          orchestrator.queue().size()));
  return exit_code;
}

int stop_command(const std::string &pid_file) {
  const pid_t pid = runner::read_pid_file(pid_file);
  if (pid <= 0) {
    std::cerr << "Error: no running instance recorded in " << pid_file
              << std::endl;
    return 1;
  }
  if (::kill(pid, SIGTERM) != 0) {
    std::cerr << "Error: cannot signal pid " << pid << ": "
              << std::strerror(errno) << std::endl;
    return 1;
  }
  std::cout << "Sent SIGTERM to " << pid << std::endl;
  return 0;
}

int history_command(const std::string &config_path, size_t limit) {
  auto cfg = load_config(config_path);
  if (!cfg) {
    return kExitUsage;
  }
  try {
    auto ledger =
        pipeline::Ledger::open_read_only(cfg->effective_ledger_path());
    for (const auto &entry : ledger->recent(limit)) {
      std::cout << runner::format_ledger_line(entry) << std::endl;
    }
    std::cout << ledger->size() << " file(s) delivered in total" << std::endl;
  } catch (const hirespipe::IOError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitStartup;
  }
  return 0;
}

int validate_command(const std::string &config_path) {
  auto cfg = load_config(config_path);
  if (!cfg) {
    return kExitUsage;
  }
  std::cout << cfg->to_yaml() << std::endl;
  std::cout << "Config OK: " << config_path << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"HiresPipe watch-folder runner"};
  app.require_subcommand(1);

  std::string config_path, pid_file, source_dir, dest_dir;
  bool once = false;
  size_t limit = 20;

  auto run_cmd = app.add_subcommand("run", "Watch the source directory and deliver");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_flag("--once", once,
                    "Process the files present now, then exit");
  run_cmd->add_option("--pid-file", pid_file, "Write the process id here");
  run_cmd->add_option("--source-dir", source_dir, "Override sourceDir");
  run_cmd->add_option("--dest-dir", dest_dir, "Override destDir");

  auto stop_cmd = app.add_subcommand("stop", "Stop a running instance");
  stop_cmd->add_option("--pid-file", pid_file, "Pid file of the instance")
      ->required();

  auto history_cmd =
      app.add_subcommand("history", "List recently delivered files");
  history_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  history_cmd->add_option("--limit", limit, "Entries to show (0 = all)")
      ->default_val(20);

  auto validate_cmd = app.add_subcommand("validate", "Check a config file");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : kExitUsage;
  }

  if (run_cmd->parsed()) {
    return run_command(config_path, once, pid_file, source_dir, dest_dir);
  }
  if (stop_cmd->parsed()) {
    return stop_command(pid_file);
  }
  if (history_cmd->parsed()) {
    return history_command(config_path, limit);
  }
  if (validate_cmd->parsed()) {
    return validate_command(config_path);
  }
  return kExitUsage;
}
