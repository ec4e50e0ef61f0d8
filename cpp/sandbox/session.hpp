#ifndef SANDBOX_SESSION_HPP
#define SANDBOX_SESSION_HPP

#include <chrono>
#include <string>
#include <vector>

#include <kj/common.h>
#include "capnp/sandbox.capnp.h"
#include "sandbox/execution.hpp"
#include "sandbox/unix.hpp"

namespace sandbox {

// Host side of one execution: validates the request, starts a worker, feeds
// it the request and collects what it sends back. A session runs once.
class Session {
 public:
  enum class State {
    kIdle,
    kCompiling,
    kRunning,
    kSucceeded,
    kFailed,
    kTimedOut,
    kFinalized
  };

  // options must have worker_executable and output_directory resolved to
  // absolute paths, and request a nonzero timeout.
  Session(const Options& options, ExecutionRequest request);
  KJ_DISALLOW_COPY(Session);

  ExecutionResult Run();

  State GetState() const { return state_; }

  // Environment of the worker, with home as HOME and TMPDIR.
  std::vector<std::string> Environment(const std::string& home) const;

 private:
  bool FillRequest(capnproto::ExecutionRequest::Builder request,
                   std::string* error_msg) const;
  // Handles bytes from the report channel: phase markers first, then the
  // report message.
  bool ConsumeReport(const char* data, size_t size);
  void Collect(const ExecutionInfo& info, const std::string& diagnostics,
               ExecutionResult* result);

  Options options_;
  ExecutionRequest request_;
  State state_ = State::kIdle;
  bool skipped_ = false;
  std::chrono::steady_clock::time_point compile_start_;
  std::string report_;
};

const char* StateName(Session::State state);

}  // namespace sandbox

#endif
