#include "sandbox/runtime_module.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#pragma GCC diagnostic pop

#include "sandbox/module_view.hpp"
#include "sandbox/output_capture.hpp"

using namespace pybind11::literals;

PYBIND11_EMBEDDED_MODULE(sandbox_runtime, m) {
  m.doc() = "Support objects for sandboxed snippets";
  pybind11::register_exception<sandbox::ImportDenied>(m, "ImportDenied",
                                                      PyExc_ImportError);
  pybind11::register_exception<sandbox::ForbiddenAccess>(
      m, "ForbiddenAccess", PyExc_PermissionError);

  pybind11::class_<sandbox::CaptureStream>(m, "CaptureStream")
      .def("write", &sandbox::CaptureStream::Write, "text"_a)
      .def("flush", &sandbox::CaptureStream::Flush)
      .def("isatty", [](const sandbox::CaptureStream&) { return false; })
      .def("readable", [](const sandbox::CaptureStream&) { return false; })
      .def("writable", [](const sandbox::CaptureStream&) { return true; })
      .def("seekable", [](const sandbox::CaptureStream&) { return false; })
      .def_property_readonly("encoding",
                             [](const sandbox::CaptureStream&) {
                               return "utf-8";
                             })
      .def_property_readonly("errors",
                             [](const sandbox::CaptureStream&) {
                               return "replace";
                             })
      .def_property_readonly("closed",
                             [](const sandbox::CaptureStream&) {
                               return false;
                             })
      .def_property_readonly("truncated", &sandbox::CaptureStream::Truncated);

  // No constructor: views are only handed out by the import gate and the
  // capability table.
  pybind11::class_<sandbox::ModuleView>(m, "ModuleView")
      .def("__getattr__", &sandbox::ModuleView::GetAttr, "name"_a)
      .def("__repr__", &sandbox::ModuleView::Repr);
}

namespace sandbox {

ImportDenied::ImportDenied(const std::string& module)
    : std::runtime_error("import of module '" + module + "' is not allowed"),
      module_(module) {}

pybind11::module RuntimeModule() {
  return pybind11::module::import("sandbox_runtime");
}

pybind11::object ImportDeniedType() {
  return RuntimeModule().attr("ImportDenied");
}

pybind11::object ForbiddenAccessType() {
  return RuntimeModule().attr("ForbiddenAccess");
}

}  // namespace sandbox
