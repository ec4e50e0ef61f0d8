#include "sandbox/module_view.hpp"

#include <set>

#include "kj/debug.h"
#include "sandbox/runtime_module.hpp"

namespace sandbox {

namespace {

// Private-looking names that only lead to strings or lists of names.
const std::set<std::string> kPublicDunders = {"__name__", "__doc__",
                                              "__all__", "__version__"};

std::string ModuleName(pybind11::handle module) {
  const char* name = PyModule_GetName(module.ptr());
  if (name == nullptr) throw pybind11::error_already_set();
  return name;
}

bool IsReachable(const std::string& module, const std::string& package,
                 const AllowedModules& allowed) {
  if (allowed.Allows(module)) return true;
  if (package.empty()) return false;
  return module == package ||
         (module.size() > package.size() &&
          module.compare(0, package.size(), package) == 0 &&
          module[package.size()] == '.');
}

}  // namespace

ModuleView::ModuleView(pybind11::module module, std::string package,
                       std::shared_ptr<const AllowedModules> allowed)
    : module_(std::move(module)),
      package_(std::move(package)),
      allowed_(std::move(allowed)) {
  KJ_REQUIRE(allowed_ != nullptr);
}

std::string ModuleView::PackageOf(const std::string& module) {
  return module.substr(0, module.find('.'));
}

std::string ModuleView::Name() const { return ModuleName(module_); }

std::string ModuleView::Repr() const { return "<module '" + Name() + "'>"; }

bool ModuleView::Reachable(const std::string& module) const {
  return IsReachable(module, package_, *allowed_);
}

pybind11::object ModuleView::Wrap(
    pybind11::object value, const std::string& package,
    const std::shared_ptr<const AllowedModules>& allowed) {
  if (!PyModule_Check(value.ptr())) return value;
  std::string name = ModuleName(value);
  if (!IsReachable(name, package, *allowed)) {
    throw ForbiddenAccess("module '" + name +
                          "' is not reachable from sandboxed code");
  }
  return pybind11::cast(
      ModuleView(pybind11::reinterpret_borrow<pybind11::module>(value),
                 package, allowed));
}

pybind11::object ModuleView::Wrap(pybind11::object value) const {
  return Wrap(std::move(value), package_, allowed_);
}

pybind11::object ModuleView::GetAttr(const std::string& name) const {
  if (name == "__dict__") return PublicNamespace();
  if (!name.empty() && name[0] == '_' && !kPublicDunders.count(name)) {
    throw ForbiddenAccess("access to attribute '" + name + "' of module '" +
                          Name() + "' is not allowed");
  }
  pybind11::object value = module_.attr(name.c_str());
  if (PyModule_Check(value.ptr())) {
    std::string target = ModuleName(value);
    if (!Reachable(target)) {
      KJ_LOG(INFO, "Module attribute denied", Name(), name, target);
      throw ForbiddenAccess("access to module '" + target + "' through '" +
                            Name() + "." + name + "' is not allowed");
    }
  }
  return Wrap(std::move(value));
}

pybind11::dict ModuleView::PublicNamespace() const {
  pybind11::dict names;
  pybind11::dict dict = module_.attr("__dict__");
  for (auto item : dict) {
    if (!PyUnicode_Check(item.first.ptr())) continue;
    std::string name = item.first.cast<std::string>();
    if (name.empty() || name[0] == '_') continue;
    pybind11::object value =
        pybind11::reinterpret_borrow<pybind11::object>(item.second);
    if (PyModule_Check(value.ptr()) && !Reachable(ModuleName(value))) {
      continue;
    }
    names[item.first] = Wrap(std::move(value));
  }
  return names;
}

}  // namespace sandbox
