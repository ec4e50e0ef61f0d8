#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>
#include <vector>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static std::string temp_directory;

  // Host-only flags
  static std::string output_directory;
  static std::string worker_executable;
  static std::vector<std::string> allowed_modules;
  static std::vector<std::string> read_roots;
  static std::vector<std::string> bindings;
  static std::string language;
  static bool expression;
  static uint32_t timeout_millis;
  static uint32_t startup_timeout_millis;
  static uint32_t max_output_bytes;
  static uint32_t memory_limit_kb;
  static uint32_t max_file_size_kb;
};

#endif
