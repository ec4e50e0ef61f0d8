#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

std::string OsRealPath(const std::string& path) {
  char buf[PATH_MAX];
  if (realpath(path.c_str(), buf) == nullptr) return "";
  return buf;
}

std::string OsCurrentDir() {
  char buf[PATH_MAX];
  if (getcwd(buf, sizeof(buf)) == nullptr) {
    throw std::system_error(errno, std::system_category(), "getcwd");
  }
  return buf;
}

}  // namespace
#endif

namespace util {
std::string File::Read(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string content;
  char buf[64 * 1024];
  while (true) {
    ssize_t amount = read(fd, buf, sizeof(buf));  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) break;
    content.append(buf, amount);
  }
  return content;
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  if (path.find_last_of(kPathSeparators) == 0) return "/";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

std::string File::Normalize(const std::string& path) {
  std::string full = path;
  if (full.empty() || full[0] != kPathSeparators[0]) {
    full = JoinPath(OsCurrentDir(), path);
  }
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= full.size()) {
    size_t next = full.find_first_of(kPathSeparators, pos);
    if (next == std::string::npos) next = full.size();
    std::string part = full.substr(pos, next - pos);
    if (part == "..") {
      if (!parts.empty()) parts.pop_back();
    } else if (!part.empty() && part != ".") {
      parts.push_back(part);
    }
    pos = next + 1;
  }
  std::string result;
  for (const auto& part : parts) result += kPathSeparators[0] + part;
  return result.empty() ? "/" : result;
}

std::string File::RealPath(const std::string& path) {
  std::string normalized = Normalize(path);
  std::string resolved = OsRealPath(normalized);
  if (!resolved.empty()) return resolved;
  std::string parent = OsRealPath(BaseDir(normalized));
  if (parent.empty()) return normalized;
  return JoinPath(parent == "/" ? "" : parent, BaseName(normalized));
}

bool File::IsWithin(const std::string& root, const std::string& path) {
  if (root == "/") return !path.empty() && path[0] == '/';
  if (path.compare(0, root.size(), root) != 0) return false;
  return path.size() == root.size() || path[root.size()] == '/';
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
