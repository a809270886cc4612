#include "runner_shared.hpp"

#include "hirespipe/core/errors.hpp"
#include "hirespipe/core/utils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace hirespipe::runner {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    throw IOError("cannot write pid file " + path_.string());
  }
  out << ::getpid() << "\n";
}

PidFile::~PidFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

pid_t read_pid_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return -1;
  }
  long pid = -1;
  if (!(in >> pid) || pid <= 0) {
    return -1;
  }
  return static_cast<pid_t>(pid);
}

nlohmann::json stats_to_json(const pipeline::OrchestratorStats &stats,
                             size_t queue_depth) {
  return {{"discovered", stats.discovered},
          {"delivered", stats.delivered},
          {"duplicates", stats.duplicates},
          {"failed", stats.failed},
          {"retries", stats.retries},
          {"abandoned", stats.abandoned},
          {"sources_deleted", stats.sources_deleted},
          {"bytes_delivered", stats.bytes_delivered},
          {"bytes_delivered_human", core::format_bytes(stats.bytes_delivered)},
          {"queue_depth", queue_depth}};
}

std::string format_ledger_line(const pipeline::LedgerEntry &entry) {
  std::ostringstream oss;
  oss << entry.completed_at << "  " << entry.source_path << " -> "
      << entry.destination_path << "  [" << entry.fingerprint.substr(0, 12)
      << "]";
  return oss.str();
}

} // namespace hirespipe::runner
