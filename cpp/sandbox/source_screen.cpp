#include "sandbox/source_screen.hpp"

#include <regex>
#include <set>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

namespace sandbox {

namespace {

// Private-looking attributes that only lead to strings, to initializers or
// to named tuple helpers.
const std::set<std::string> kAllowedPrivateAttributes = {
    "__init__", "__name__", "__qualname__", "__doc__",
    "_asdict",  "_replace", "_fields",      "_make"};
const std::set<std::string> kAllowedDunderNames = {"__name__"};
const std::set<std::string> kAllowedDunderConstants = {"__main__"};

// Attributes of frames, generators, coroutines and tracebacks.
const std::set<std::string> kFrameAttributes = {
    "gi_frame", "gi_code",   "cr_frame",  "cr_code",   "ag_frame",
    "ag_code",  "tb_frame",  "tb_next",   "f_back",    "f_globals",
    "f_locals", "f_builtins", "f_code",   "f_trace"};

enum class Rules { kAll, kAttributes };

bool IsDunder(const std::string& name) {
  return name.size() > 2 && name.compare(0, 2, "__") == 0;
}

bool IsDunderWord(const std::string& text) {
  static const std::regex dunder(R"(__\w+__)");
  return std::regex_match(text, dunder);
}

// True if a component of a dotted name starts with an underscore.
bool HasPrivateComponent(const std::string& dotted) {
  size_t pos = 0;
  while (pos < dotted.size()) {
    if (dotted[pos] == '_') return true;
    size_t dot = dotted.find('.', pos);
    if (dot == std::string::npos) break;
    pos = dot + 1;
  }
  return false;
}

std::string LineOf(pybind11::handle node) {
  if (!pybind11::hasattr(node, "lineno")) return "";
  return " (line " + pybind11::str(node.attr("lineno")).cast<std::string>() +
         ")";
}

bool CheckAttribute(pybind11::handle node, std::string* reason) {
  std::string attr = node.attr("attr").cast<std::string>();
  if ((!attr.empty() && attr[0] == '_' &&
       !kAllowedPrivateAttributes.count(attr)) ||
      kFrameAttributes.count(attr)) {
    *reason =
        "access to attribute '" + attr + "' is not allowed" + LineOf(node);
    return false;
  }
  return true;
}

bool CheckImport(pybind11::handle node, pybind11::handle import_from_type,
                 std::string* reason) {
  std::vector<std::string> names;
  if (pybind11::isinstance(node, import_from_type)) {
    pybind11::object module = node.attr("module");
    if (!module.is_none()) names.push_back(module.cast<std::string>());
  }
  for (pybind11::handle alias : node.attr("names")) {
    names.push_back(alias.attr("name").cast<std::string>());
  }
  for (const std::string& name : names) {
    if (HasPrivateComponent(name)) {
      *reason = "import of '" + name + "' is not allowed" + LineOf(node);
      return false;
    }
  }
  return true;
}

bool Screen(const std::string& source, Rules rules, std::string* reason) {
  static const std::regex format_field(R"(\{[^{}]*[.\[]\s*_)");
  pybind11::module ast = pybind11::module::import("ast");
  pybind11::object tree = ast.attr("parse")(source, "<sandbox>", "exec");
  pybind11::object attribute_type = ast.attr("Attribute");
  pybind11::object name_type = ast.attr("Name");
  pybind11::object constant_type = ast.attr("Constant");
  pybind11::object import_type = ast.attr("Import");
  pybind11::object import_from_type = ast.attr("ImportFrom");
  for (pybind11::handle node : ast.attr("walk")(tree)) {
    if (pybind11::isinstance(node, attribute_type)) {
      if (!CheckAttribute(node, reason)) return false;
    }
    if (rules == Rules::kAttributes) continue;
    if (pybind11::isinstance(node, import_type) ||
        pybind11::isinstance(node, import_from_type)) {
      if (!CheckImport(node, import_from_type, reason)) return false;
    } else if (pybind11::isinstance(node, name_type)) {
      std::string id = node.attr("id").cast<std::string>();
      if (IsDunder(id) && !kAllowedDunderNames.count(id)) {
        *reason = "use of name '" + id + "' is not allowed" + LineOf(node);
        return false;
      }
    } else if (pybind11::isinstance(node, constant_type)) {
      pybind11::object value = node.attr("value");
      if (!pybind11::isinstance<pybind11::str>(value)) continue;
      std::string text =
          pybind11::bytes(value.attr("encode")("utf-8", "replace"));
      if (IsDunderWord(text) && !kAllowedDunderConstants.count(text)) {
        *reason =
            "string constant '" + text + "' is not allowed" + LineOf(node);
        return false;
      }
      if (std::regex_search(text, format_field)) {
        *reason = "format string accessing private attributes is not "
                  "allowed" +
                  LineOf(node);
        return false;
      }
    }
  }
  return true;
}

}  // namespace

bool ScreenSource(const std::string& source, std::string* reason) {
  return Screen(source, Rules::kAll, reason);
}

bool ScreenAttributes(const std::string& source, std::string* reason) {
  try {
    return Screen(source, Rules::kAttributes, reason);
  } catch (pybind11::error_already_set& exc) {
    if (!exc.matches(PyExc_SyntaxError) && !exc.matches(PyExc_ValueError)) {
      throw;
    }
    return true;
  }
}

}  // namespace sandbox
