#ifndef SANDBOX_MODULE_VIEW_HPP
#define SANDBOX_MODULE_VIEW_HPP

#include <memory>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

#include "sandbox/allowlist.hpp"

namespace sandbox {

// What sandboxed code holds in place of a module. Attribute lookups are
// forwarded to the module, except for private names. A lookup that yields a
// module returns another view if that module is reachable, and raises
// ForbiddenAccess otherwise. A module is reachable if it is allowed, or if it
// lies inside the package the view was granted for.
class ModuleView {
 public:
  ModuleView(pybind11::module module, std::string package,
             std::shared_ptr<const AllowedModules> allowed);

  pybind11::object GetAttr(const std::string& name) const;
  std::string Name() const;
  std::string Repr() const;
  const pybind11::module& Module() const { return module_; }

  // Returns value itself unless it is a module, and a view of it otherwise.
  // package is the package the view is granted for.
  static pybind11::object Wrap(
      pybind11::object value, const std::string& package,
      const std::shared_ptr<const AllowedModules>& allowed);

  // Top-level package of a dotted module name.
  static std::string PackageOf(const std::string& module);

 private:
  bool Reachable(const std::string& module) const;
  pybind11::object Wrap(pybind11::object value) const;
  // Public attributes of the module; what "from module import *" sees when
  // the module has no __all__.
  pybind11::dict PublicNamespace() const;

  pybind11::module module_;
  std::string package_;
  std::shared_ptr<const AllowedModules> allowed_;
};

}  // namespace sandbox

#endif
