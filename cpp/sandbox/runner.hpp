#ifndef SANDBOX_RUNNER_HPP
#define SANDBOX_RUNNER_HPP

#include <functional>
#include <memory>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

#include "capnp/sandbox.capnp.h"
#include "sandbox/audit_guard.hpp"
#include "sandbox/import_gate.hpp"

namespace sandbox {

// Where a runner writes. The report descriptor only receives the phase
// markers; the report message itself is written by the caller.
struct RunnerChannels {
  int report = -1;
  int out = -1;
  int err = -1;
};

// Worker side of one execution. Needs a running interpreter.
class Runner {
 public:
  // on_compiling runs right after the compiling marker is written.
  Runner(capnproto::ExecutionRequest::Reader request, RunnerChannels channels,
         std::function<void()> on_compiling = nullptr);

  // Loads the capabilities and installs the audit hook. Library imports
  // happen here, before the time budget starts.
  void Prepare();

  // Compiles and runs the snippet, and fills report. In expression mode the
  // snippet is a single expression and its value is reported too. Errors of
  // the snippet end up in the report; exceptions only signal failures of the
  // runner.
  void Run(capnproto::ExecutionReport::Builder report);

  // Paths sandboxed code may read and write.
  GuardPolicy Policy() const;

 private:
  void WriteMarker(char marker);

  capnproto::ExecutionRequest::Reader request_;
  RunnerChannels channels_;
  std::function<void()> on_compiling_;
  std::unique_ptr<ImportGate> gate_;
  pybind11::dict builtins_;
  pybind11::cpp_function import_function_;
};

// Fills error from the Python exception held by exc.
void DescribeError(const pybind11::error_already_set& exc,
                   capnproto::Error::Builder error);

}  // namespace sandbox

#endif
