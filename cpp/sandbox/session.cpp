#include "sandbox/session.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>

#include "kj/debug.h"
#include "sandbox/output_buffer.hpp"
#include "sandbox/value_json.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace sandbox {
namespace {

using std::chrono::milliseconds;
using std::chrono::steady_clock;

const size_t kDiagnosticsTail = 64 * 1024;
const int32_t kMaxFiles = 256;
// How long a killed worker may take to close its channels, and how long a
// worker that closed them may take to exit.
const milliseconds kDrainTime{1000};
const milliseconds kReapTime{1000};

// ASCII identifiers only.
bool IsBindingName(const std::string& name) {
  if (name.empty() || name.compare(0, 2, "__") == 0) return false;
  unsigned char first = name[0];
  if (!std::isalpha(first) && first != '_') return false;
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_';
  });
}

bool IsPython(const std::string& language) {
  static const std::string kPython = "python";
  auto same = [](unsigned char a, char b) { return std::tolower(a) == b; };
  return language.size() == kPython.size() &&
         std::equal(language.begin(), language.end(), kPython.begin(), same);
}

int PollTimeout(steady_clock::time_point now, steady_clock::time_point limit) {
  auto left = std::chrono::duration_cast<milliseconds>(limit - now);
  return static_cast<int>(std::max<int64_t>(left.count(), 0) + 1);
}

}  // namespace

const char* StateName(Session::State state) {
  switch (state) {
    case Session::State::kIdle:
      return "Idle";
    case Session::State::kCompiling:
      return "Compiling";
    case Session::State::kRunning:
      return "Running";
    case Session::State::kSucceeded:
      return "Succeeded";
    case Session::State::kFailed:
      return "Failed";
    case Session::State::kTimedOut:
      return "TimedOut";
    case Session::State::kFinalized:
      return "Finalized";
  }
  return "Unknown";
}

Session::Session(const Options& options, ExecutionRequest request)
    : options_(options), request_(std::move(request)) {
  KJ_REQUIRE(request_.timeout.count() > 0, "the timeout must be resolved");
}

std::vector<std::string> Session::Environment(const std::string& home) const {
  std::vector<std::string> env = {
      "PATH=/usr/local/bin:/usr/bin:/bin",
      "HOME=" + home,
      "TMPDIR=" + home,
      "MPLCONFIGDIR=" +
          util::File::JoinPath(options_.temp_directory, "matplotlib"),
      "MPLBACKEND=Agg",
      "PYTHONHASHSEED=0",
      "PYTHONDONTWRITEBYTECODE=1",
      "PYTHONNOUSERSITE=1",
      "PYTHONIOENCODING=utf-8",
      "LANG=C.UTF-8",
      "OMP_NUM_THREADS=1",
      "OPENBLAS_NUM_THREADS=1",
      "MKL_NUM_THREADS=1"};
  // Needed to find the interpreter in non standard installations.
  for (const char* name : {"PYTHONHOME", "PYTHONPATH", "LD_LIBRARY_PATH"}) {
    const char* value = getenv(name);  // NOLINT
    if (value != nullptr) env.push_back(std::string(name) + "=" + value);
  }
  return env;
}

bool Session::FillRequest(capnproto::ExecutionRequest::Builder request,
                          std::string* error_msg) const {
  if (!IsPython(request_.language)) {
    *error_msg = "Unsupported language: " + request_.language;
    return false;
  }
  if (request_.source_text.find('\0') != std::string::npos) {
    *error_msg = "The source contains NUL bytes";
    return false;
  }
  request.setSource(request_.source_text);
  request.setExpression(request_.expression);

  auto bindings = request.initBindings(request_.extra_bindings.size());
  size_t pos = 0;
  for (const auto& binding : request_.extra_bindings) {
    if (!IsBindingName(binding.first)) {
      *error_msg = "Invalid binding name '" + binding.first + "'";
      return false;
    }
    auto entry = bindings[pos++];
    entry.setName(binding.first);
    try {
      DecodeValue(kj::StringPtr(binding.second.c_str(), binding.second.size()),
                  entry.initValue());
    } catch (kj::Exception& exc) {
      *error_msg = "Binding '" + binding.first + "' is not valid JSON: " +
                   exc.getDescription().cStr();
      return false;
    }
  }

  auto modules = request.initAllowedModules(options_.allowed_modules.size());
  for (size_t i = 0; i < options_.allowed_modules.size(); i++) {
    modules.set(i, options_.allowed_modules[i]);
  }
  auto roots = request.initReadRoots(options_.read_roots.size());
  for (size_t i = 0; i < options_.read_roots.size(); i++) {
    roots.set(i, options_.read_roots[i]);
  }
  request.setOutputDirectory(options_.output_directory);
  request.setMaxOutputBytes(options_.max_output_bytes);
  request.setTimeoutMillis(request_.timeout.count());
  return true;
}

bool Session::ConsumeReport(const char* data, size_t size) {
  size_t pos = 0;
  while (pos < size && state_ != State::kRunning && !skipped_) {
    char marker = data[pos++];
    if (state_ == State::kIdle && marker == kCompilingMarker) {
      state_ = State::kCompiling;
      compile_start_ = steady_clock::now();
    } else if (state_ == State::kCompiling && marker == kRunningMarker) {
      state_ = State::kRunning;
    } else if (state_ == State::kCompiling && marker == kSkippedMarker) {
      skipped_ = true;
    } else {
      KJ_LOG(ERROR, "Unexpected marker from the worker",
             static_cast<int>(marker), StateName(state_));
      return false;
    }
  }
  report_.append(data + pos, size - pos);
  return true;
}

ExecutionResult Session::Run() {
  KJ_REQUIRE(state_ == State::kIdle, "A session runs only once",
             StateName(state_));
  ExecutionResult result;
  std::string error_msg;

  capnp::MallocMessageBuilder message;
  if (!FillRequest(message.initRoot<capnproto::ExecutionRequest>(),
                   &error_msg)) {
    state_ = State::kFinalized;
    result.error_kind = ErrorKind::INVALID_REQUEST;
    result.error_message = error_msg;
    return result;
  }
  kj::Array<capnp::word> words = capnp::messageToFlatArray(message);
  kj::ArrayPtr<const kj::byte> payload = words.asBytes();

  util::TempDir home(options_.temp_directory);
  SpawnOptions spawn;
  spawn.executable = options_.worker_executable;
  spawn.args = {"worker"};
  if (Flags::verbose) spawn.args.push_back("--verbose");
  spawn.env = Environment(home.Path());
  spawn.root = options_.output_directory;
  spawn.cpu_limit_millis =
      (options_.startup_timeout + request_.timeout + milliseconds(1000))
          .count();
  spawn.memory_limit_kb = options_.memory_limit_kb;
  spawn.max_file_size_kb = options_.max_file_size_kb;
  spawn.max_files = kMaxFiles;

  auto start = steady_clock::now();
  ChildProcess child;
  if (!child.Start(spawn, &error_msg)) {
    KJ_LOG(ERROR, "Cannot start the worker", error_msg);
    state_ = State::kFinalized;
    result.error_kind = ErrorKind::INTERNAL_ERROR;
    result.error_message = "Cannot start the worker: " + error_msg;
    return result;
  }

  BoundedBuffer out(options_.max_output_bytes);
  BoundedBuffer err(options_.max_output_bytes);
  TailBuffer diagnostics(kDiagnosticsTail);
  size_t sent = 0;
  bool protocol_error = false;
  bool timed_out = false;
  bool budget_started = false;
  auto deadline = start + options_.startup_timeout;
  steady_clock::time_point drain_deadline;
  char buffer[64 * 1024];

  while (true) {
    std::vector<struct pollfd> fds;
    std::vector<int> channels;
    for (int channel = 0; channel < kNumChannels; channel++) {
      if (child.Fd(channel) == -1) continue;
      struct pollfd fd {};
      fd.fd = child.Fd(channel);
      fd.events = channel == kRequestFd ? POLLOUT : POLLIN;
      fds.push_back(fd);
      channels.push_back(channel);
    }
    if (fds.empty()) break;

    auto now = steady_clock::now();
    auto limit = timed_out ? drain_deadline : deadline;
    if (now >= limit) {
      if (timed_out) {
        KJ_LOG(WARNING, "Worker channels still open after kill", child.Pid());
        break;
      }
      timed_out = true;
      child.Kill();
      drain_deadline = now + kDrainTime;
      continue;
    }

    int ready = poll(fds.data(), fds.size(), PollTimeout(now, limit));
    if (ready < 0) {
      if (errno == EINTR) continue;
      KJ_FAIL_SYSCALL("poll", errno);
    }
    for (size_t i = 0; i < fds.size(); i++) {
      if (fds[i].revents == 0) continue;
      int channel = channels[i];
      if (channel == kRequestFd) {
        ssize_t n = send(fds[i].fd, payload.begin() + sent,
                         payload.size() - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
          if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            continue;
          KJ_LOG(WARNING, "Cannot send the request", strerror(errno));
          child.Close(channel);
          continue;
        }
        sent += n;
        if (sent == payload.size()) child.Close(channel);
        continue;
      }
      ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
      if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
          continue;
        KJ_LOG(WARNING, "Cannot read from the worker", channel,
               strerror(errno));
        child.Close(channel);
        continue;
      }
      if (n == 0) {
        child.Close(channel);
        continue;
      }
      switch (channel) {
        case kReportFd:
          if (!ConsumeReport(buffer, n)) {
            protocol_error = true;
            child.Kill();
            child.Close(channel);
          }
          break;
        case kDiagnosticsFd:
          diagnostics.Append(buffer, n);
          break;
        case kStdoutFd:
          out.Append(buffer, n);
          break;
        case kStderrFd:
          err.Append(buffer, n);
          break;
        default:
          KJ_UNREACHABLE;
      }
    }
    if (!budget_started && state_ != State::kIdle) {
      budget_started = true;
      deadline = compile_start_ + request_.timeout;
    }
  }
  auto end = steady_clock::now();

  ExecutionInfo info;
  auto reap_deadline = end + kReapTime;
  while (!child.TryWait(&info)) {
    if (steady_clock::now() >= reap_deadline) {
      child.Kill();
      child.Wait(&info);
      break;
    }
    std::this_thread::sleep_for(milliseconds(5));
  }

  result.stdout_text = out.Data();
  result.stderr_text = err.Data();
  result.stdout_truncated = out.Truncated();
  result.stderr_truncated = err.Truncated();
  result.cpu_time = milliseconds(info.cpu_time_millis + info.sys_time_millis);
  result.memory_usage_kb = info.memory_usage_kb;
  result.elapsed = std::chrono::duration_cast<milliseconds>(end - start);
  result.startup = std::chrono::duration_cast<milliseconds>(
      (state_ == State::kIdle ? end : compile_start_) - start);

  if (timed_out) {
    if (state_ == State::kIdle) {
      state_ = State::kFailed;
      result.error_kind = ErrorKind::INTERNAL_ERROR;
      result.error_message =
          "The worker did not start within " +
          std::to_string(options_.startup_timeout.count()) + " ms";
      result.error_detail = diagnostics.Data();
    } else {
      state_ = State::kTimedOut;
      result.error_kind = ErrorKind::TIMEOUT;
      result.error_message = "Execution timed out after " +
                             std::to_string(request_.timeout.count()) + " ms";
    }
  } else if (protocol_error) {
    state_ = State::kFailed;
    result.error_kind = ErrorKind::INTERNAL_ERROR;
    result.error_message = "Malformed data from the worker";
    result.error_detail = diagnostics.Data();
  } else {
    Collect(info, diagnostics.Data(), &result);
  }

  if (result.error_kind == ErrorKind::INTERNAL_ERROR) {
    KJ_LOG(WARNING, "Worker failed", result.error_message, diagnostics.Data());
  }
  KJ_LOG(INFO, "Session finished", StateName(state_), result.elapsed.count(),
         result.cpu_time.count(), result.memory_usage_kb);
  state_ = State::kFinalized;
  return result;
}

void Session::Collect(const ExecutionInfo& info, const std::string& diagnostics,
                      ExecutionResult* result) {
  if (!report_.empty() && report_.size() % sizeof(capnp::word) == 0) {
    try {
      auto words = kj::heapArray<capnp::word>(report_.size() /
                                              sizeof(capnp::word));
      memcpy(words.begin(), report_.data(), report_.size());
      capnp::ReaderOptions options;
      options.traversalLimitInWords = 1ULL << 32;
      capnp::FlatArrayMessageReader reader(words, options);
      auto report = reader.getRoot<capnproto::ExecutionReport>();

      result->success = report.getSuccess();
      auto error = report.getError();
      result->error_kind = error.getKind();
      result->error_category = error.getCategory().cStr();
      result->error_message = error.getMessage().cStr();
      result->error_detail = error.getDetail().cStr();
      for (auto variable : report.getVariables()) {
        result->produced_variables[variable.getName().cStr()] =
            EncodeValue(variable.getValue());
      }
      for (auto name : report.getFallbacks()) {
        result->serialization_fallbacks.push_back(name.cStr());
      }
      for (auto path : report.getArtifacts()) {
        result->artifact_paths.push_back(path.cStr());
      }
      if (request_.expression && result->success) {
        result->value = EncodeValue(report.getValue());
      }
      result->stdout_truncated |= report.getStdoutTruncated();
      result->stderr_truncated |= report.getStderrTruncated();
      state_ = result->success ? State::kSucceeded : State::kFailed;
      return;
    } catch (kj::Exception& exc) {
      KJ_LOG(ERROR, "Malformed report from the worker", exc.getDescription());
      result->success = false;
      result->error_category.clear();
      result->produced_variables.clear();
      result->serialization_fallbacks.clear();
      result->artifact_paths.clear();
      result->value.clear();
    }
  }

  state_ = State::kFailed;
  result->error_detail = diagnostics;
  if (info.signal == SIGXCPU) {
    state_ = State::kTimedOut;
    result->error_kind = ErrorKind::TIMEOUT;
    result->error_message = "CPU time limit exceeded";
  } else if (info.signal == SIGXFSZ) {
    result->error_kind = ErrorKind::RESOURCE_LIMIT;
    result->error_message = "File size limit exceeded";
  } else if (info.signal != 0) {
    result->error_kind = ErrorKind::INTERNAL_ERROR;
    result->error_message = std::string("The worker was killed by signal ") +
                            std::to_string(info.signal) + " (" +
                            strsignal(info.signal) + ")";
  } else {
    result->error_kind = ErrorKind::INTERNAL_ERROR;
    result->error_message = "The worker exited with status " +
                            std::to_string(info.status_code) +
                            " without a report";
  }
}

}  // namespace sandbox
