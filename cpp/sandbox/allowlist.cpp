#include "sandbox/allowlist.hpp"

#include <algorithm>
#include <cctype>

namespace sandbox {

namespace {
std::string Trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}
}  // namespace

AllowedModules::AllowedModules(const std::vector<std::string>& names) {
  for (const auto& name : names) {
    std::string module = Trim(name);
    if (!module.empty()) names_.insert(module);
  }
}

bool AllowedModules::Allows(const std::string& module) const {
  if (module.empty() || module.front() == '.' || module.back() == '.') {
    return false;
  }
  if (module.find("..") != std::string::npos) return false;
  std::string prefix = module;
  while (true) {
    if (names_.count(prefix)) return true;
    size_t dot = prefix.find_last_of('.');
    if (dot == std::string::npos) return false;
    prefix.resize(dot);
  }
}

std::vector<std::string> DefaultAllowedModules() {
  return {"math",     "cmath",       "statistics", "random",    "decimal",
          "fractions", "numbers",    "datetime",   "calendar",  "time",
          "collections", "itertools", "functools", "heapq",     "bisect",
          "array",    "copy",        "re",         "textwrap",  "json",
          "numpy",    "pandas",      "matplotlib"};
}

}  // namespace sandbox
