#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <mutex>
#include <string>

#include "sandbox/execution.hpp"

namespace sandbox {

// Entry point for running untrusted snippets. Every call runs in its own
// worker process; calls from different threads are independent.
class Sandbox {
 public:
  struct Stats {
    uint64_t executions = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t timed_out = 0;
  };

  explicit Sandbox(Options options);
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // Runs the snippet in request. Never throws: every failure, including
  // failures of the sandbox itself, is reported in the result.
  ExecutionResult Execute(const ExecutionRequest& request);

  Stats GetStats() const;
  const Options& GetOptions() const { return options_; }

 private:
  ExecutionResult ExecuteInternal(ExecutionRequest request);
  void Record(const ExecutionResult& result);

  Options options_;
  mutable std::mutex mutex_;
  Stats stats_;
};

}  // namespace sandbox

#endif
