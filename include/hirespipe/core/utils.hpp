#pragma once

#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hirespipe::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string format_iso_timestamp(SystemTime tp);
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string format_bytes(uint64_t bytes);

// Hash utilities (SHA-256, lowercase hex)
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::string shell_quote(const std::string& s);

// Paths are arbitrary bytes on POSIX; JSON strings must be UTF-8.
bool is_valid_utf8(const std::string& s);
std::string hex_encode(const std::string& bytes);
std::string hex_decode(const std::string& hex);   // throws ValidationError

} // namespace hirespipe::core
