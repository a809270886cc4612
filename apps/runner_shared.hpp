#pragma once

#include "hirespipe/pipeline/ledger.hpp"
#include "hirespipe/pipeline/orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <streambuf>
#include <string>
#include <sys/types.h>

namespace hirespipe::runner {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Writes the current pid on construction and removes the file on
// destruction. Throws IOError if the file cannot be written.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

private:
  std::filesystem::path path_;
};

// Returns -1 if the file is missing or does not hold a pid.
pid_t read_pid_file(const std::filesystem::path &path);

nlohmann::json stats_to_json(const pipeline::OrchestratorStats &stats,
                             size_t queue_depth);

std::string format_ledger_line(const pipeline::LedgerEntry &entry);

} // namespace hirespipe::runner
