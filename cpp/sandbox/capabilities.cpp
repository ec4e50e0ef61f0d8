#include "sandbox/capabilities.hpp"

#include <kj/debug.h>
#include "sandbox/module_view.hpp"
#include "sandbox/runtime_module.hpp"

namespace sandbox {

namespace {

const char* const kBuiltins[] = {
    // Types
    "bool", "bytearray", "bytes", "complex", "dict", "float", "frozenset",
    "int", "list", "object", "range", "set", "slice", "str", "tuple",
    "enumerate", "filter", "map", "reversed", "zip", "property",
    "staticmethod", "classmethod", "super",
    // Functions
    "abs", "all", "any", "ascii", "bin", "callable", "chr", "divmod",
    "format", "hash", "hex", "isinstance", "issubclass", "iter", "len", "max",
    "min", "next", "oct", "ord", "pow", "print", "repr", "round", "sorted",
    "sum", "type",
    // Needed by class statements.
    "__build_class__",
    // Exceptions, so that try/except works.
    "BaseException", "Exception", "ArithmeticError", "AssertionError",
    "AttributeError", "FloatingPointError", "ImportError", "IndexError",
    "KeyError", "LookupError", "MemoryError", "ModuleNotFoundError",
    "NameError", "NotImplementedError", "OverflowError", "RecursionError",
    "RuntimeError", "StopIteration", "TypeError", "UnboundLocalError",
    "UnicodeError", "ValueError", "ZeroDivisionError",
    // Warnings
    "Warning", "DeprecationWarning", "FutureWarning", "RuntimeWarning",
    "UserWarning"};

const char* const kConstants[] = {"Ellipsis", "NotImplemented"};

// Modules bound under their own name, usable without an import.
const char* const kPreboundModules[] = {
    "math", "random", "datetime", "json", "re", "collections", "itertools",
    "functools", "matplotlib"};

std::vector<Capability> Table() {
  std::vector<Capability> entries;
  for (const char* name : kConstants) {
    entries.push_back({name, CapabilityKind::kConstant, "builtins", name});
  }
  for (const char* name : kBuiltins) {
    entries.push_back({name, CapabilityKind::kBuiltin, "builtins", name});
  }
  entries.push_back({"np", CapabilityKind::kLibrary, "numpy", ""});
  entries.push_back({"pd", CapabilityKind::kLibrary, "pandas", ""});
  entries.push_back({"plt", CapabilityKind::kLibrary, "matplotlib.pyplot", ""});
  for (const char* name : kPreboundModules) {
    entries.push_back({name, CapabilityKind::kLibrary, name, ""});
  }
  return entries;
}

}  // namespace

CapabilitySet::CapabilitySet(std::vector<Capability> entries)
    : entries_(std::move(entries)) {
  for (size_t i = 0; i < entries_.size(); i++) {
    KJ_REQUIRE(index_.emplace(entries_[i].name, i).second,
               "duplicate capability", entries_[i].name);
  }
}

const Capability* CapabilitySet::Find(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return nullptr;
  return &entries_[it->second];
}

std::vector<std::string> CapabilitySet::Names() const {
  std::vector<std::string> names;
  names.reserve(index_.size());
  for (const auto& entry : index_) names.push_back(entry.first);
  return names;
}

const CapabilitySet& Capabilities::Build() {
  static const CapabilitySet set(Table());
  return set;
}

pybind11::dict Capabilities::Materialize(
    const CapabilitySet& set, const pybind11::object& import_function,
    const std::shared_ptr<const AllowedModules>& allowed) {
  RuntimeModule();
  pybind11::dict builtins;
  for (const Capability& capability : set.Entries()) {
    pybind11::object value;
    try {
      if (capability.kind == CapabilityKind::kLibrary &&
          capability.module == "matplotlib.pyplot") {
        pybind11::module::import("matplotlib").attr("use")("Agg");
      }
      value = pybind11::module::import(capability.module.c_str());
      if (!capability.attribute.empty()) {
        value = value.attr(capability.attribute.c_str());
      }
      value = ModuleView::Wrap(std::move(value),
                               ModuleView::PackageOf(capability.module),
                               allowed);
    } catch (pybind11::error_already_set& exc) {
      if (capability.kind != CapabilityKind::kLibrary) throw;
      KJ_LOG(INFO, "Library not available", capability.name,
             capability.module, exc.what());
      continue;
    }
    builtins[capability.name.c_str()] = value;
  }
  builtins["__import__"] = import_function;
  return builtins;
}

}  // namespace sandbox
