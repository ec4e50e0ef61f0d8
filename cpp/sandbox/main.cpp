#include "sandbox/main.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#pragma GCC diagnostic pop

#include "capnp/sandbox.capnp.h"
#include "kj/debug.h"
#include "sandbox/channels.hpp"
#include "sandbox/runner.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace sandbox {
namespace {

// Lowers the CPU limit to what has been used so far plus the time budget of
// the snippet. The limit set by the host also covers the interpreter startup.
void LimitCpu(uint64_t timeout_millis) {
  if (timeout_millis == 0) return;
  struct rusage usage {};
  KJ_SYSCALL(getrusage(RUSAGE_SELF, &usage));
  rlim_t budget = usage.ru_utime.tv_sec + usage.ru_stime.tv_sec + 1 +
                  (timeout_millis + 999) / 1000 + 1;
  struct rlimit rlim {};
  KJ_SYSCALL(getrlimit(RLIMIT_CPU, &rlim));
  if (rlim.rlim_cur != RLIM_INFINITY && rlim.rlim_cur <= budget) return;
  rlim.rlim_cur = budget;
  if (rlim.rlim_max == RLIM_INFINITY || rlim.rlim_max > budget + 1)
    rlim.rlim_max = budget + 1;
  KJ_SYSCALL(setrlimit(RLIMIT_CPU, &rlim));
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context, "worker");

  capnp::MallocMessageBuilder request_message;
  {
    capnp::ReaderOptions options;
    options.traversalLimitInWords = 1ULL << 30;
    capnp::StreamFdMessageReader reader(kRequestFd, options);
    request_message.setRoot(reader.getRoot<capnproto::ExecutionRequest>());
  }
  auto request =
      request_message.getRoot<capnproto::ExecutionRequest>().asReader();

  // Keep the report channel away from the descriptors the interpreter
  // hands out, and send stray writes on the process stdout to the
  // captured stdout.
  int report_fd;
  KJ_SYSCALL(report_fd = fcntl(kReportFd, F_DUPFD_CLOEXEC, 16));
  KJ_SYSCALL(close(kReportFd));
  KJ_SYSCALL(dup2(kStdoutFd, STDOUT_FILENO));
  int null_fd;
  KJ_SYSCALL(null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC));  // NOLINT
  KJ_SYSCALL(dup2(null_fd, STDIN_FILENO));
  KJ_SYSCALL(close(null_fd));

  pybind11::scoped_interpreter interpreter;
  capnp::MallocMessageBuilder report_message;
  auto report = report_message.initRoot<capnproto::ExecutionReport>();
  {
    uint64_t timeout_millis = request.getTimeoutMillis();
    RunnerChannels channels;
    channels.report = report_fd;
    channels.out = kStdoutFd;
    channels.err = kStderrFd;
    Runner runner(request, channels,
                  [timeout_millis]() { LimitCpu(timeout_millis); });
    runner.Prepare();
    runner.Run(report);
  }
  capnp::writeMessageToFd(report_fd, report_message);
  KJ_LOG(INFO, "Report written", report.getSuccess());
  // Skip the interpreter finalization: objects left by the snippet must not
  // run code once the guard is gone.
  context.exit();
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context,
                         "Script Sandbox Worker (" + util::version + ")",
                         "Runs one snippet received from the host")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
