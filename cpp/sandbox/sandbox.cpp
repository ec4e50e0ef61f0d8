#include "sandbox/sandbox.hpp"

#include <exception>

#include "kj/debug.h"
#include "sandbox/session.hpp"
#include "util/file.hpp"
#include "whereami++.h"

namespace sandbox {

Sandbox::Sandbox(Options options) : options_(std::move(options)) {
  if (options_.worker_executable.empty()) {
    options_.worker_executable = whereami::getExecutablePath();
  }
  options_.worker_executable =
      util::File::RealPath(options_.worker_executable);
  if (options_.default_timeout.count() <= 0) {
    options_.default_timeout = Options().default_timeout;
  }
  if (options_.startup_timeout.count() <= 0) {
    options_.startup_timeout = Options().startup_timeout;
  }
}

ExecutionResult Sandbox::Execute(const ExecutionRequest& request) {
  ExecutionResult result;
  try {
    result = ExecuteInternal(request);
  } catch (kj::Exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc);
    result = ExecutionResult();
    result.error_kind = ErrorKind::INTERNAL_ERROR;
    result.error_message = exc.getDescription().cStr();
  } catch (std::exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc.what());
    result = ExecutionResult();
    result.error_kind = ErrorKind::INTERNAL_ERROR;
    result.error_message = exc.what();
  }
  Record(result);
  return result;
}

ExecutionResult Sandbox::ExecuteInternal(ExecutionRequest request) {
  if (request.timeout.count() <= 0) request.timeout = options_.default_timeout;
  // The directory may have been removed since the previous call.
  Options options = options_;
  util::File::MakeDirs(options.output_directory);
  options.output_directory = util::File::RealPath(options.output_directory);
  for (std::string& root : options.read_roots) {
    root = util::File::RealPath(root);
  }
  options.temp_directory = util::File::Normalize(options.temp_directory);
  Session session(options, std::move(request));
  return session.Run();
}

void Sandbox::Record(const ExecutionResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.executions++;
  if (result.success) {
    stats_.succeeded++;
  } else if (result.error_kind == ErrorKind::TIMEOUT) {
    stats_.timed_out++;
  } else {
    stats_.failed++;
  }
  KJ_LOG(INFO, "Execution finished", result.success,
         ErrorKindName(result.error_kind), result.elapsed.count(),
         stats_.executions);
}

Sandbox::Stats Sandbox::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace sandbox
