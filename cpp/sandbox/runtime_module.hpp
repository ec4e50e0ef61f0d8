#ifndef SANDBOX_RUNTIME_MODULE_HPP
#define SANDBOX_RUNTIME_MODULE_HPP

#include <stdexcept>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

namespace sandbox {

// Raised for an import outside the allowed modules. Python code sees it as
// sandbox_runtime.ImportDenied, a subclass of ImportError.
class ImportDenied : public std::runtime_error {
 public:
  explicit ImportDenied(const std::string& module);
  const std::string& Module() const { return module_; }

 private:
  std::string module_;
};

// Raised when sandboxed code reaches for something outside its
// capabilities. Python code sees it as sandbox_runtime.ForbiddenAccess, a
// subclass of PermissionError.
class ForbiddenAccess : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The embedded "sandbox_runtime" module, imported on first use.
pybind11::module RuntimeModule();

pybind11::object ImportDeniedType();
pybind11::object ForbiddenAccessType();

}  // namespace sandbox

#endif
