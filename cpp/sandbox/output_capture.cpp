#include "sandbox/output_capture.hpp"

#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <ctime>

#include <kj/debug.h>
#include "sandbox/output_buffer.hpp"
#include "util/file.hpp"

namespace sandbox {

size_t CaptureStream::Write(const pybind11::str& text) {
  size_t length = pybind11::len(text);
  if (truncated_) return length;
  std::string data = pybind11::bytes(text.attr("encode")("utf-8", "replace"));
  size_t keep = Utf8SafePrefix(data.data(), data.size(), limit_ - written_);
  if (keep < data.size()) truncated_ = true;
  size_t pos = 0;
  while (pos < keep) {
    ssize_t amount = write(fd_, data.data() + pos, keep - pos);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      // The host is gone; nobody can read the rest.
      KJ_LOG(WARNING, "output stream closed", strerror(errno));
      truncated_ = true;
      return length;
    }
    pos += amount;
  }
  written_ += keep;
  return length;
}

OutputRedirect::OutputRedirect(pybind11::object out, pybind11::object err) {
  pybind11::module sys = pybind11::module::import("sys");
  saved_out_ = sys.attr("stdout");
  saved_err_ = sys.attr("stderr");
  sys.attr("stdout") = std::move(out);
  sys.attr("stderr") = std::move(err);
}

OutputRedirect::~OutputRedirect() {
  // PySys_SetObject does not raise.
  PySys_SetObject("stdout", saved_out_.ptr());
  PySys_SetObject("stderr", saved_err_.ptr());
}

std::string PlotFileName(uint64_t seq) {
  struct timeval now {};
  gettimeofday(&now, nullptr);
  struct tm tm {};
  localtime_r(&now.tv_sec, &tm);
  char date[32];
  strftime(date, sizeof(date), "%Y%m%d_%H%M%S", &tm);
  char millis[8];
  snprintf(millis, sizeof(millis), "%03ld",  // NOLINT
           static_cast<long>(now.tv_usec / 1000));
  return "plot_" + std::string(date) + "_" + millis + "_" +
         std::to_string(getpid()) + "_" + std::to_string(seq) + ".png";
}

std::vector<std::string> FigureSaver::SaveAll() {
  std::vector<std::string> paths;
  pybind11::dict modules = pybind11::module::import("sys").attr("modules");
  if (!modules.contains("matplotlib.pyplot")) return paths;
  pybind11::object plt = modules["matplotlib.pyplot"];
  for (pybind11::handle num : plt.attr("get_fignums")()) {
    std::string path = util::File::JoinPath(directory_, PlotFileName(seq_++));
    try {
      pybind11::object figure = plt.attr("figure")(num);
      figure.attr("savefig")(path);
      plt.attr("close")(figure);
      paths.push_back(path);
    } catch (pybind11::error_already_set& exc) {
      KJ_LOG(WARNING, "Failed to save figure", exc.what());
      plt.attr("close")(num);
    }
  }
  return paths;
}

}  // namespace sandbox
