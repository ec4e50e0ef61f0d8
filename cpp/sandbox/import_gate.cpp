#include "sandbox/import_gate.hpp"

#include <kj/debug.h>
#include "sandbox/module_view.hpp"
#include "sandbox/runtime_module.hpp"

using namespace pybind11::literals;

namespace sandbox {

ImportGate::ImportGate(AllowedModules allowed)
    : allowed_(std::make_shared<const AllowedModules>(std::move(allowed))),
      real_import_(pybind11::module::import("builtins").attr("__import__")) {
  // Registers ImportDenied and ModuleView.
  RuntimeModule();
}

pybind11::object ImportGate::Import(const std::string& name,
                                    pybind11::object globals,
                                    pybind11::object locals,
                                    pybind11::object fromlist,
                                    int level) const {
  if (level > 0) {
    KJ_LOG(INFO, "Relative import denied", name, level);
    throw ImportDenied(std::string(level, '.') + name);
  }
  if (!allowed_->Allows(name)) {
    KJ_LOG(INFO, "Import denied", name);
    throw ImportDenied(name);
  }
  pybind11::object module =
      real_import_(name, globals, locals, fromlist, level);
  return ModuleView::Wrap(std::move(module), ModuleView::PackageOf(name),
                          allowed_);
}

pybind11::cpp_function ImportGate::AsFunction() const {
  return pybind11::cpp_function(
      [this](const std::string& name, pybind11::object globals,
             pybind11::object locals, pybind11::object fromlist, int level) {
        return Import(name, std::move(globals), std::move(locals),
                      std::move(fromlist), level);
      },
      pybind11::name("__import__"), "name"_a, "globals"_a = pybind11::none(),
      "locals"_a = pybind11::none(), "fromlist"_a = pybind11::tuple(),
      "level"_a = 0);
}

}  // namespace sandbox
