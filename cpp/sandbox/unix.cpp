#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kStrErrorBufSize = 2048;
// Channel descriptors are moved above this number before being placed, so
// that no dup2 can overwrite a descriptor that is still needed.
static const constexpr int kFirstSpareFd = 16;

void SetError(const char* prefix, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  *error_msg = prefix;
  *error_msg += ": ";
  *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
}

std::vector<char*> MakeArgv(const std::vector<std::string>& strings,
                            std::vector<std::vector<char>>* storage) {
  std::vector<char*> ptrs;
  for (const std::string& s : strings) {
    storage->emplace_back(s.c_str(), s.c_str() + s.size() + 1);
  }
  for (auto& s : *storage) ptrs.push_back(s.data());
  ptrs.push_back(nullptr);
  return ptrs;
}

// Runs in the forked child. Only async-signal-safe functions are called here.
[[noreturn]] void Child(const sandbox::SpawnOptions& options,
                        const int* child_fds, int error_fd, char** argv,
                        char** envp) {
  error_fd = fcntl(error_fd, F_DUPFD_CLOEXEC, kFirstSpareFd);
  if (error_fd == -1) _Exit(1);

  auto die2 = [error_fd](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (write(error_fd, &len, sizeof(len)) == sizeof(len)) {
      if (write(error_fd, buf, len) != len) _Exit(1);
    }
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // Own session and process group, so that the host can kill everything the
  // worker starts, and the worker does not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  int spare[sandbox::kNumChannels];
  for (int channel = 0; channel < sandbox::kNumChannels; channel++) {
    spare[channel] = fcntl(child_fds[channel], F_DUPFD_CLOEXEC, kFirstSpareFd);
    if (spare[channel] == -1) die("fcntl", errno);
  }
  for (int channel = 0; channel < sandbox::kNumChannels; channel++) {
    if (dup2(spare[channel], channel) == -1) die("redir", errno);
  }

  if (chdir(options.root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value, slack)             \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim + (slack);            \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options.memory_limit_kb * 1024, 0);
  // The soft limit delivers SIGXCPU, one more second ends in SIGKILL.
  SET_RLIM(CPU, (options.cpu_limit_millis + 999) / 1000, 1);
  SET_RLIM(FSIZE, options.max_file_size_kb * 1024, 0);
  SET_RLIM(NOFILE, options.max_files, 0);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  execve(options.executable.c_str(), argv, envp);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

}  // namespace

namespace sandbox {

bool ChildProcess::Start(const SpawnOptions& options, std::string* error_msg) {
  KJ_REQUIRE(pid_ == -1, "process already started");
  kj::AutoCloseFd child_fds[kNumChannels];

  int sv[2];
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == -1) {
    SetError("socketpair", error_msg);
    return false;
  }
  fds_[kRequestFd] = kj::AutoCloseFd(sv[0]);
  child_fds[kRequestFd] = kj::AutoCloseFd(sv[1]);
  for (int channel = kReportFd; channel < kNumChannels; channel++) {
    int pipe_fds[2];
    if (pipe2(pipe_fds, O_CLOEXEC) == -1) {  // NOLINT
      SetError("pipe2", error_msg);
      return false;
    }
    fds_[channel] = kj::AutoCloseFd(pipe_fds[0]);
    child_fds[channel] = kj::AutoCloseFd(pipe_fds[1]);
  }
  int error_pipe[2];
  if (pipe2(error_pipe, O_CLOEXEC) == -1) {  // NOLINT
    SetError("pipe2", error_msg);
    return false;
  }
  kj::AutoCloseFd error_read(error_pipe[0]);
  kj::AutoCloseFd error_write(error_pipe[1]);

  int raw_child_fds[kNumChannels];
  for (int channel = 0; channel < kNumChannels; channel++) {
    raw_child_fds[channel] = child_fds[channel].get();
  }
  std::vector<std::string> args = {options.executable};
  args.insert(args.end(), options.args.begin(), options.args.end());
  std::vector<std::vector<char>> args_storage;
  std::vector<std::vector<char>> env_storage;
  std::vector<char*> argv = MakeArgv(args, &args_storage);
  std::vector<char*> envp = MakeArgv(options.env, &env_storage);

  int fork_result = fork();
  if (fork_result == -1) {
    SetError("fork", error_msg);
    return false;
  }
  if (fork_result == 0) {
    Child(options, raw_child_fds, error_write.get(), argv.data(),
          envp.data());
  }
  pid_ = fork_result;
  start_ = std::chrono::steady_clock::now();
  for (auto& fd : child_fds) fd = nullptr;
  error_write = nullptr;

  ssize_t error_len = 0;
  if (read(error_read, &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= static_cast<ssize_t>(sizeof(error))) {
      error_len = sizeof(error) - 1;
    }
    KJ_SYSCALL(read(error_read, error, error_len), "Failed to read from fd");
    *error_msg = error;
    ExecutionInfo info;
    Wait(&info);
    return false;
  }

  for (int channel = 0; channel < kNumChannels; channel++) {
    int flags = 0;
    KJ_SYSCALL(flags = fcntl(fds_[channel], F_GETFL));
    KJ_SYSCALL(fcntl(fds_[channel], F_SETFL, flags | O_NONBLOCK));
  }
  return true;
}

void ChildProcess::Kill() {
  if (!Running()) return;
  killed_ = true;
  // The group may not exist yet if the child has not called setsid.
  if (kill(-pid_, SIGKILL) == -1 && errno != ESRCH) {
    KJ_LOG(WARNING, "kill", strerror(errno));
  }
  if (kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
    KJ_LOG(WARNING, "kill", strerror(errno));
  }
}

bool ChildProcess::TryWait(ExecutionInfo* info) {
  KJ_REQUIRE(Running(), "process not running");
  int status = 0;
  struct rusage rusage {};
  int ret = 0;
  KJ_SYSCALL(ret = wait4(pid_, &status, WNOHANG, &rusage));
  if (ret != pid_) return false;
  Fill(status, rusage, info);
  return true;
}

void ChildProcess::Wait(ExecutionInfo* info) {
  KJ_REQUIRE(Running(), "process not running");
  int status = 0;
  struct rusage rusage {};
  KJ_SYSCALL(wait4(pid_, &status, 0, &rusage));
  Fill(status, rusage, info);
}

void ChildProcess::Fill(int status, const struct rusage& rusage,
                        ExecutionInfo* info) {
  reaped_ = true;
  info->memory_usage_kb = rusage.ru_maxrss;
  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  // SIGXCPU comes from the CPU limit.
  info->killed = killed_ || info->signal == SIGXCPU;
  info->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start_)
          .count();
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
}

ChildProcess::~ChildProcess() {
  if (!Running()) return;
  Kill();
  int status = 0;
  while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
  }
  reaped_ = true;
}

}  // namespace sandbox
