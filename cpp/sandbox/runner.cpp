#include "sandbox/runner.hpp"

#include <errno.h>
#include <unistd.h>

#include <algorithm>

#include "kj/debug.h"
#include "sandbox/capabilities.hpp"
#include "sandbox/channels.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/runtime_module.hpp"
#include "sandbox/serializer.hpp"
#include "sandbox/source_screen.hpp"
#include "util/file.hpp"

namespace sandbox {
namespace {

const char* kSourceName = "<sandbox>";
const char* kModuleName = "__sandbox__";

// Directories outside the interpreter that libraries read at run time.
const char* kSystemReadRoots[] = {"/usr/share/fonts", "/usr/local/share/fonts",
                                  "/usr/share/zoneinfo", "/etc/localtime"};

std::string SafeStr(pybind11::handle obj) {
  try {
    return pybind11::str(obj).cast<std::string>();
  } catch (pybind11::error_already_set& exc) {
    return "<unprintable " + Serializer::StableText(obj.get_type()) + ">";
  }
}

// Lets traceback show the lines of the snippet.
void RegisterSource(const std::string& source) {
  pybind11::module linecache = pybind11::module::import("linecache");
  pybind11::str text(source);
  linecache.attr("cache")[kSourceName] = pybind11::make_tuple(
      source.size(), pybind11::none(), text.attr("splitlines")(true),
      kSourceName);
}

}  // namespace

Runner::Runner(capnproto::ExecutionRequest::Reader request,
               RunnerChannels channels, std::function<void()> on_compiling)
    : request_(request),
      channels_(channels),
      on_compiling_(std::move(on_compiling)) {}

void Runner::Prepare() {
  RuntimeModule();
  AuditGuard::Install();
  std::vector<std::string> modules;
  for (auto name : request_.getAllowedModules()) modules.push_back(name.cStr());
  gate_ = std::make_unique<ImportGate>(AllowedModules(modules));
  import_function_ = gate_->AsFunction();
  builtins_ = Capabilities::Materialize(Capabilities::Build(),
                                       import_function_, gate_->Allowed());
  // Used to report errors; loaded now so that their imports are not charged
  // to the snippet.
  pybind11::module::import("traceback");
  pybind11::module::import("linecache");
}

GuardPolicy Runner::Policy() const {
  GuardPolicy policy;
  policy.output_directory =
      util::File::RealPath(request_.getOutputDirectory().cStr());
  auto add = [&policy](const std::string& path) {
    if (path.empty()) return;
    std::string root = util::File::RealPath(path);
    if (root == "/") return;
    if (std::find(policy.read_roots.begin(), policy.read_roots.end(), root) !=
        policy.read_roots.end())
      return;
    policy.read_roots.push_back(root);
  };
  pybind11::module sys = pybind11::module::import("sys");
  for (const char* attr :
       {"prefix", "exec_prefix", "base_prefix", "base_exec_prefix"}) {
    if (pybind11::hasattr(sys, attr))
      add(sys.attr(attr).cast<std::string>());
  }
  for (auto entry : sys.attr("path")) {
    if (pybind11::isinstance<pybind11::str>(entry))
      add(entry.cast<std::string>());
  }
  pybind11::dict modules = sys.attr("modules");
  if (modules.contains("matplotlib")) {
    pybind11::object matplotlib = modules["matplotlib"];
    for (const char* getter :
         {"get_data_path", "get_configdir", "get_cachedir"}) {
      try {
        add(matplotlib.attr(getter)().cast<std::string>());
      } catch (pybind11::error_already_set& exc) {
        KJ_LOG(WARNING, "Cannot locate matplotlib data", getter, exc.what());
      }
    }
  }
  for (const char* root : kSystemReadRoots) add(root);
  for (auto root : request_.getReadRoots()) add(root.cStr());
  return policy;
}

void Runner::WriteMarker(char marker) {
  while (true) {
    ssize_t written = write(channels_.report, &marker, 1);
    if (written == 1) return;
    if (written < 0 && errno == EINTR) continue;
    KJ_FAIL_SYSCALL("write", errno, channels_.report);
  }
}

void Runner::Run(capnproto::ExecutionReport::Builder report) {
  KJ_REQUIRE(gate_ != nullptr, "Prepare() was not called");
  std::string source = request_.getSource().cStr();
  report.setSuccess(false);

  WriteMarker(kCompilingMarker);
  if (on_compiling_) on_compiling_();

  bool expression = request_.getExpression();
  pybind11::object code = pybind11::reinterpret_steal<pybind11::object>(
      Py_CompileString(source.c_str(), kSourceName,
                       expression ? Py_eval_input : Py_file_input));
  if (!code) {
    pybind11::error_already_set exc;
    WriteMarker(kSkippedMarker);
    DescribeError(exc, report.initError());
    return;
  }
  std::string reason;
  if (!ScreenSource(source, &reason)) {
    WriteMarker(kSkippedMarker);
    auto error = report.initError();
    error.setKind(capnproto::ErrorKind::FORBIDDEN_ACCESS);
    error.setCategory("ForbiddenAccess");
    error.setMessage(reason);
    return;
  }

  GuardPolicy policy = Policy();
  pybind11::dict globals;
  globals["__builtins__"] = builtins_;
  globals["__name__"] = kModuleName;
  globals["__doc__"] = pybind11::none();
  for (auto binding : request_.getBindings()) {
    globals[pybind11::str(binding.getName().cStr())] =
        ToPython(binding.getValue());
  }
  RegisterSource(source);

  CaptureStream out(channels_.out, request_.getMaxOutputBytes());
  CaptureStream err(channels_.err, request_.getMaxOutputBytes());
  std::vector<std::string> artifacts;
  // Described once the guard is gone: formatting a traceback parses the
  // source lines of library frames.
  std::unique_ptr<pybind11::error_already_set> failure;

  WriteMarker(kRunningMarker);
  {
    AuditGuard::Scope guard(policy);
    OutputRedirect redirect(
        pybind11::cast(&out, pybind11::return_value_policy::reference),
        pybind11::cast(&err, pybind11::return_value_policy::reference));
    pybind11::object value = pybind11::reinterpret_steal<pybind11::object>(
        PyEval_EvalCode(code.ptr(), globals.ptr(), globals.ptr()));
    if (!value) {
      failure.reset(new pybind11::error_already_set());
    } else {
      report.setSuccess(true);
      report.initError().setKind(capnproto::ErrorKind::NONE);
    }

    Serializer serializer;
    if (value && expression) {
      serializer.Convert(value, report.initValue());
      serializer.Reset();
    }
    serializer.CollectVariables(globals, report);

    artifacts = guard.WrittenFiles();
    FigureSaver saver(policy.output_directory);
    for (const std::string& path : saver.SaveAll()) {
      if (std::find(artifacts.begin(), artifacts.end(), path) ==
          artifacts.end())
        artifacts.push_back(path);
    }
  }

  if (failure) DescribeError(*failure, report.initError());
  auto list = report.initArtifacts(artifacts.size());
  for (size_t i = 0; i < artifacts.size(); i++) list.set(i, artifacts[i]);
  report.setStdoutTruncated(out.Truncated());
  report.setStderrTruncated(err.Truncated());
}

void DescribeError(const pybind11::error_already_set& exc,
                   capnproto::Error::Builder error) {
  pybind11::object type = exc.type();
  pybind11::object value = exc.value();
  pybind11::object trace = exc.trace();

  capnproto::ErrorKind kind = capnproto::ErrorKind::RUNTIME_ERROR;
  if (exc.matches(ImportDeniedType())) {
    kind = capnproto::ErrorKind::IMPORT_DENIED;
  } else if (exc.matches(ForbiddenAccessType())) {
    kind = capnproto::ErrorKind::FORBIDDEN_ACCESS;
  } else if (exc.matches(PyExc_SyntaxError)) {
    kind = capnproto::ErrorKind::SYNTAX_ERROR;
  } else if (exc.matches(PyExc_NameError)) {
    kind = capnproto::ErrorKind::NAME_ERROR;
  } else if (exc.matches(PyExc_MemoryError)) {
    kind = capnproto::ErrorKind::RESOURCE_LIMIT;
  } else if (exc.matches(PyExc_OSError) && value &&
             pybind11::hasattr(value, "errno") &&
             value.attr("errno").equal(pybind11::int_(EFBIG))) {
    // Hit the file size limit.
    kind = capnproto::ErrorKind::RESOURCE_LIMIT;
  }
  error.setKind(kind);

  if (pybind11::hasattr(type, "__name__"))
    error.setCategory(type.attr("__name__").cast<std::string>());
  error.setMessage(value ? SafeStr(value) : std::string());

  try {
    pybind11::module traceback = pybind11::module::import("traceback");
    pybind11::object lines = traceback.attr("format_exception")(
        type, value ? value : pybind11::none(),
        trace ? trace : pybind11::none());
    error.setDetail(pybind11::str("").attr("join")(lines).cast<std::string>());
  } catch (pybind11::error_already_set& format_error) {
    KJ_LOG(WARNING, "Cannot format traceback", format_error.what());
  }
}

}  // namespace sandbox
