#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <kj/io.h>
#include "sandbox/channels.hpp"

namespace sandbox {

// Settings to start a worker process.
struct SpawnOptions {
  std::string executable;
  // Arguments after argv[0].
  std::vector<std::string> args;
  // Complete environment of the process, as NAME=value entries.
  std::vector<std::string> env;
  // Working directory.
  std::string root;

  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int64_t max_file_size_kb = 0;
  int32_t max_files = 0;
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool killed = false;
  std::string message;
};

// A process started with the worker channels in place: kRequestFd is a
// socket the parent writes to, the other channels are pipes the parent reads
// from. The process gets its own session and process group. Destroying the
// object kills the whole group and reaps the process.
class ChildProcess {
 public:
  ChildProcess() = default;
  ~ChildProcess();
  KJ_DISALLOW_COPY(ChildProcess);

  // Starts the process. Returns true if the program was started. Otherwise,
  // returns false and sets error_msg.
  bool Start(const SpawnOptions& options, std::string* error_msg);

  // Parent end of the given channel, or -1 once closed.
  int Fd(int channel) const { return fds_[channel].get(); }
  void Close(int channel) { fds_[channel] = nullptr; }

  // Sends SIGKILL to the process group.
  void Kill();

  // Reaps the process if it has exited. Returns true if it did, and sets
  // fields in info.
  bool TryWait(ExecutionInfo* info);

  // Blocks until the process exits.
  void Wait(ExecutionInfo* info);

  pid_t Pid() const { return pid_; }
  bool Running() const { return pid_ > 0 && !reaped_; }

 private:
  void Fill(int status, const struct rusage& rusage, ExecutionInfo* info);

  kj::AutoCloseFd fds_[kNumChannels];
  pid_t pid_ = -1;
  bool reaped_ = false;
  bool killed_ = false;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace sandbox

#endif
