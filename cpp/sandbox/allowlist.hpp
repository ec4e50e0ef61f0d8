#ifndef SANDBOX_ALLOWLIST_HPP
#define SANDBOX_ALLOWLIST_HPP

#include <set>
#include <string>
#include <vector>

namespace sandbox {

// The fixed set of modules sandboxed code may import. A module is allowed if
// it, or one of the packages containing it, is in the set: allowing "numpy"
// also allows "numpy.linalg".
class AllowedModules {
 public:
  explicit AllowedModules(const std::vector<std::string>& names);

  bool Allows(const std::string& module) const;
  const std::set<std::string>& Names() const { return names_; }

 private:
  std::set<std::string> names_;
};

// Numeric, text and data-analysis modules without I/O of their own.
std::vector<std::string> DefaultAllowedModules();

}  // namespace sandbox

#endif
