#ifndef SANDBOX_IMPORT_GATE_HPP
#define SANDBOX_IMPORT_GATE_HPP

#include <memory>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

#include "sandbox/allowlist.hpp"

namespace sandbox {

// Replacement for __import__ in the builtins of sandboxed code. Allowed
// modules are loaded through the interpreter's real import machinery and
// handed out as ModuleViews, every other request raises ImportDenied.
// Relative imports are always denied.
class ImportGate {
 public:
  explicit ImportGate(AllowedModules allowed);

  pybind11::object Import(const std::string& name, pybind11::object globals,
                          pybind11::object locals, pybind11::object fromlist,
                          int level) const;

  // A Python callable with the signature of builtins.__import__. The gate
  // must outlive it.
  pybind11::cpp_function AsFunction() const;

  const std::shared_ptr<const AllowedModules>& Allowed() const {
    return allowed_;
  }

 private:
  std::shared_ptr<const AllowedModules> allowed_;
  pybind11::object real_import_;
};

}  // namespace sandbox

#endif
