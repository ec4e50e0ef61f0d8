#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <string>

#include <kj/common.h>

namespace util {

class File {
 public:
  // Reads the whole content of the file specified by path.
  static std::string Read(const std::string& path);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Removes "." and ".." components and duplicate separators. Relative
  // paths are first joined to the current working directory.
  static std::string Normalize(const std::string& path);

  // Absolute path with symlinks resolved. For a path that does not exist
  // yet, only its parent directory is resolved.
  static std::string RealPath(const std::string& path);

  // Returns true if path is root itself or lies below it. Both must be
  // absolute and normalized.
  static bool IsWithin(const std::string& root, const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
