#ifndef SANDBOX_OUTPUT_CAPTURE_HPP
#define SANDBOX_OUTPUT_CAPTURE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

namespace sandbox {

// File-like object installed as sys.stdout or sys.stderr. Text is encoded as
// UTF-8 and written to fd as it arrives, until limit bytes have been written;
// anything after that is dropped.
class CaptureStream {
 public:
  CaptureStream(int fd, size_t limit) : fd_(fd), limit_(limit) {}

  size_t Write(const pybind11::str& text);
  void Flush() {}

  bool Truncated() const { return truncated_; }
  size_t Written() const { return written_; }

 private:
  int fd_;
  size_t limit_;
  size_t written_ = 0;
  bool truncated_ = false;
};

// Replaces sys.stdout and sys.stderr for its lifetime. The previous streams
// are restored on destruction, whichever way the scope is left.
class OutputRedirect {
 public:
  OutputRedirect(pybind11::object out, pybind11::object err);
  ~OutputRedirect();
  OutputRedirect(const OutputRedirect&) = delete;
  OutputRedirect& operator=(const OutputRedirect&) = delete;

 private:
  pybind11::object saved_out_;
  pybind11::object saved_err_;
};

// plot_<YYYYmmdd_HHMMSS>_<millis>_<pid>_<seq>.png
std::string PlotFileName(uint64_t seq);

// Saves the open matplotlib figures under a directory, then closes them.
class FigureSaver {
 public:
  explicit FigureSaver(std::string directory)
      : directory_(std::move(directory)) {}

  // Returns the paths of the saved figures, in figure creation order. Does
  // nothing if pyplot was never imported.
  std::vector<std::string> SaveAll();

 private:
  std::string directory_;
  uint64_t seq_ = 0;
};

}  // namespace sandbox

#endif
