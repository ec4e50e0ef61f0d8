#ifndef SANDBOX_EXECUTION_HPP
#define SANDBOX_EXECUTION_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "capnp/sandbox.capnp.h"

namespace sandbox {

using ErrorKind = capnproto::ErrorKind;

// Stable name of an error kind, as it appears in results.
const char* ErrorKindName(ErrorKind kind);

// One snippet to run. A zero timeout selects the configured default.
struct ExecutionRequest {
  std::string source_text;
  // Only "python" is supported, in any letter case.
  std::string language = "python";
  // The source is a single expression whose value is reported as value.
  bool expression = false;
  // Variable name -> JSON document, bound before the snippet runs.
  std::map<std::string, std::string> extra_bindings;
  std::chrono::milliseconds timeout{0};
};

struct ExecutionResult {
  bool success = false;
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated = false;
  bool stderr_truncated = false;

  ErrorKind error_kind = ErrorKind::NONE;
  // Name of the error class raised by the snippet, e.g. ZeroDivisionError.
  std::string error_category;
  std::string error_message;
  std::string error_detail;

  // Variable name -> JSON text of its value.
  std::map<std::string, std::string> produced_variables;
  // Variables that could only be rendered as text.
  std::vector<std::string> serialization_fallbacks;
  std::vector<std::string> artifact_paths;
  // JSON text of the expression's value. Empty unless the request was an
  // expression that succeeded.
  std::string value;

  // Wall time from starting the worker until its result was collected.
  std::chrono::milliseconds elapsed{0};
  // Part of elapsed spent before the snippet started compiling.
  std::chrono::milliseconds startup{0};
  std::chrono::milliseconds cpu_time{0};
  int64_t memory_usage_kb = 0;
};

// Renders a result as a JSON object.
std::string ToJson(const ExecutionResult& result);

struct Options {
  // Binary to start with the "worker" subcommand. Empty means this binary.
  std::string worker_executable;
  std::string output_directory = "generated_plots";
  std::vector<std::string> allowed_modules;
  // Extra directories the snippet may read from.
  std::vector<std::string> read_roots;
  std::chrono::milliseconds default_timeout{30000};
  // Execute returns within startup_timeout + timeout + 2 s.
  std::chrono::milliseconds startup_timeout{10000};
  uint64_t max_output_bytes = 1024 * 1024;
  int64_t memory_limit_kb = 2 * 1024 * 1024;
  int64_t max_file_size_kb = 64 * 1024;
  // Parent of the per-execution home directories.
  std::string temp_directory = "/tmp/script-sandbox";

  Options();
  static Options FromFlags();
};

}  // namespace sandbox

#endif
