#ifndef SANDBOX_AUDIT_GUARD_HPP
#define SANDBOX_AUDIT_GUARD_HPP

#include <set>
#include <string>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

namespace sandbox {

// What sandboxed code may touch while a guard scope is active. All paths are
// absolute with symlinks resolved.
struct GuardPolicy {
  // The only directory that may be written.
  std::string output_directory;
  // Directories and files that may be read, besides output_directory.
  std::vector<std::string> read_roots;
};

// Runtime enforcement through a CPython audit hook. The hook is installed
// once per process and stays dormant until a Scope activates it. While
// active, denied events raise ForbiddenAccess in the code that caused them.
class AuditGuard {
 public:
  // Installs the hook. Needs a running interpreter; calling it more than once
  // has no effect.
  static void Install();

  // True for events that are denied regardless of their arguments.
  static bool IsDeniedEvent(const std::string& event);

  class Scope {
   public:
    explicit Scope(GuardPolicy policy);
    ~Scope();
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    // Regular files opened for writing inside the output directory, in
    // order of first write.
    const std::vector<std::string>& WrittenFiles() const { return written_; }

    // Decides on one audit event. Returns an empty string if it is allowed,
    // the reason otherwise.
    std::string Check(const std::string& event, PyObject* args);

   private:
    std::string CheckRead(const std::string& path) const;
    std::string CheckWrite(const std::string& path, bool is_file);
    // Source compiled at run time, e.g. by pandas eval; imports of source
    // files are not screened.
    std::string CheckCompile(PyObject* source, PyObject* filename);

    GuardPolicy policy_;
    // Set while CheckCompile parses, as parsing compiles too.
    bool screening_ = false;
    std::vector<std::string> written_;
    std::set<std::string> written_set_;
  };
};

}  // namespace sandbox

#endif
