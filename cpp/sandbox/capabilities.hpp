#ifndef SANDBOX_CAPABILITIES_HPP
#define SANDBOX_CAPABILITIES_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

#include "sandbox/allowlist.hpp"

namespace sandbox {

enum class CapabilityKind {
  // A builtins value that is not callable, e.g. Ellipsis.
  kConstant,
  // A pure builtin function or type.
  kBuiltin,
  // An entry point of a library, e.g. np for numpy. Modules are handed out
  // as ModuleViews.
  kLibrary
};

// One symbol reachable from sandboxed code. For builtins, module is
// "builtins" and attribute is the builtin's name. A library entry with an
// empty attribute is the module itself.
struct Capability {
  std::string name;
  CapabilityKind kind;
  std::string module;
  std::string attribute;
};

// Immutable name -> capability mapping.
class CapabilitySet {
 public:
  explicit CapabilitySet(std::vector<Capability> entries);

  bool Contains(const std::string& name) const { return index_.count(name); }
  // Returns nullptr if name is not an entry.
  const Capability* Find(const std::string& name) const;
  std::vector<std::string> Names() const;
  const std::vector<Capability>& Entries() const { return entries_; }

 private:
  std::vector<Capability> entries_;
  std::map<std::string, size_t> index_;
};

class Capabilities {
 public:
  // The fixed capability table. Built once, shared by every session.
  static const CapabilitySet& Build();

  // Resolves every entry into a dictionary to be used as __builtins__ of
  // sandboxed code, with import_function bound as __import__. Library
  // entries whose module cannot be loaded are left out. Library modules are
  // wrapped in views that reach their own package and the allowed modules.
  static pybind11::dict Materialize(
      const CapabilitySet& set, const pybind11::object& import_function,
      const std::shared_ptr<const AllowedModules>& allowed);
};

}  // namespace sandbox

#endif
