#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <mutex>
#include <ostream>
#include <string>
#include "backward.hpp"

namespace util {

// Formats kj log lines for the process and prints a stack trace on fatal
// errors. role is printed on every line, so that host and worker lines can be
// told apart once the worker diagnostics are attached to a result.
class LogManager : public kj::ExceptionCallback {
 public:
  LogManager(kj::ProcessContext& context, std::string role);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  std::string role_;
  bool colors_;
  std::mutex mutex_;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
