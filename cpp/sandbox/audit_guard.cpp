#include "sandbox/audit_guard.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <exception>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

#include <kj/debug.h>
#include "sandbox/runtime_module.hpp"
#include "sandbox/source_screen.hpp"
#include "util/file.hpp"

namespace sandbox {

namespace {

// Entries ending with a dot deny every event with that prefix, the others
// deny exactly one event.
const char* const kDeniedEvents[] = {
    // Network
    "socket.", "urllib.Request", "http.client.", "ftplib.", "smtplib.",
    "poplib.", "imaplib.", "nntplib.", "telnetlib.", "webbrowser.open",
    // Processes
    "subprocess.Popen", "os.system", "os.exec", "os.posix_spawn", "os.spawn",
    "os.fork", "os.forkpty", "os.kill", "os.killpg", "pty.spawn",
    "signal.pthread_kill", "os.startfile",
    // Foreign code
    "ctypes.", "mmap.__new__",
    // Introspection of the interpreter
    "sys.settrace", "sys.setprofile", "sys._current_frames",
    "sys._current_exceptions", "sys.addaudithook", "gc.get_objects",
    "gc.get_referrers", "gc.get_referents",
    // Process state
    "os.chdir", "os.putenv", "os.unsetenv", "resource.setrlimit",
    "resource.prlimit",
    // Filesystem mutation
    "os.remove", "os.rmdir", "os.rename", "os.link", "os.symlink",
    "os.chmod", "os.chown", "os.chflags", "os.truncate", "os.utime",
    "os.setxattr", "os.removexattr", "shutil."};

// Reads that are always allowed.
const char* const kAlwaysReadable[] = {"/dev/null", "/dev/urandom"};

AuditGuard::Scope* active_scope = nullptr;
PyObject* forbidden_access = nullptr;

// Extracts a filesystem path from an event argument. Returns false if the
// argument refers to an already open descriptor.
bool PathArgument(PyObject* arg, std::string* path) {
  if (arg == nullptr) return false;
  if (arg == Py_None) {
    *path = ".";
    return true;
  }
  if (PyLong_Check(arg)) return false;
  pybind11::object fspath =
      pybind11::reinterpret_steal<pybind11::object>(PyOS_FSPath(arg));
  if (!fspath) throw pybind11::error_already_set();
  if (PyUnicode_Check(fspath.ptr())) {
    fspath = pybind11::reinterpret_steal<pybind11::object>(
        PyUnicode_EncodeFSDefault(fspath.ptr()));
    if (!fspath) throw pybind11::error_already_set();
  }
  *path = pybind11::bytes(fspath);
  return true;
}

bool IsWriteOpen(PyObject* mode, PyObject* flags) {
  if (mode != nullptr && PyUnicode_Check(mode)) {
    const char* m = PyUnicode_AsUTF8(mode);
    if (m != nullptr && strpbrk(m, "wax+") != nullptr) return true;
  }
  if (flags != nullptr && PyLong_Check(flags)) {
    long f = PyLong_AsLong(flags);
    if (f == -1 && PyErr_Occurred()) throw pybind11::error_already_set();
    if (f & (O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND)) return true;
  }
  return false;
}

PyObject* Arg(PyObject* args, Py_ssize_t i) {
  if (!PyTuple_Check(args) || PyTuple_GET_SIZE(args) <= i) return nullptr;
  return PyTuple_GET_ITEM(args, i);
}

}  // namespace

bool AuditGuard::IsDeniedEvent(const std::string& event) {
  for (const char* denied : kDeniedEvents) {
    size_t len = strlen(denied);
    if (denied[len - 1] == '.') {
      if (event.compare(0, len, denied) == 0) return true;
    } else if (event == denied) {
      return true;
    }
  }
  return false;
}

std::string AuditGuard::Scope::CheckRead(const std::string& path) const {
  std::string real = util::File::RealPath(path);
  if (util::File::IsWithin(policy_.output_directory, real)) return "";
  for (const std::string& root : policy_.read_roots) {
    if (util::File::IsWithin(root, real)) return "";
  }
  for (const char* readable : kAlwaysReadable) {
    if (real == readable) return "";
  }
  return "reading '" + real + "' is not allowed";
}

std::string AuditGuard::Scope::CheckWrite(const std::string& path,
                                          bool is_file) {
  std::string real = util::File::RealPath(path);
  if (!util::File::IsWithin(policy_.output_directory, real) ||
      real == policy_.output_directory) {
    return "writing '" + real + "' is not allowed";
  }
  if (is_file && written_set_.insert(real).second) written_.push_back(real);
  return "";
}

std::string AuditGuard::Scope::CheckCompile(PyObject* source,
                                            PyObject* filename) {
  if (screening_ || source == nullptr) return "";
  if (filename != nullptr && PyUnicode_Check(filename)) {
    const char* name = PyUnicode_AsUTF8(filename);
    if (name == nullptr) throw pybind11::error_already_set();
    if (name[0] == '/' && access(name, F_OK) == 0) return "";
  }
  std::string text;
  if (PyUnicode_Check(source)) {
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(source, &size);
    if (data == nullptr) throw pybind11::error_already_set();
    text.assign(data, size);
  } else if (PyBytes_Check(source)) {
    text.assign(PyBytes_AS_STRING(source), PyBytes_GET_SIZE(source));
  } else {
    return "";
  }
  screening_ = true;
  KJ_DEFER(screening_ = false);
  std::string reason;
  if (!ScreenAttributes(text, &reason)) return "compiled code: " + reason;
  return "";
}

std::string AuditGuard::Scope::Check(const std::string& event,
                                     PyObject* args) {
  if (event == "compile") return CheckCompile(Arg(args, 0), Arg(args, 1));
  std::string path;
  if (event == "open") {
    if (!PathArgument(Arg(args, 0), &path)) return "";
    if (IsWriteOpen(Arg(args, 1), Arg(args, 2))) {
      return CheckWrite(path, true);
    }
    return CheckRead(path);
  }
  if (event == "os.listdir" || event == "os.scandir") {
    if (!PathArgument(Arg(args, 0), &path)) return "";
    return CheckRead(path);
  }
  if (event == "os.mkdir") {
    if (!PathArgument(Arg(args, 0), &path)) return "";
    return CheckWrite(path, false);
  }
  if (IsDeniedEvent(event)) return "'" + event + "' is not allowed";
  return "";
}

namespace {

int Hook(const char* event, PyObject* args, void* /*user_data*/) {
  AuditGuard::Scope* scope = active_scope;
  if (scope == nullptr) return 0;
  std::string reason;
  try {
    reason = scope->Check(event, args);
  } catch (pybind11::error_already_set& exc) {
    reason = std::string("cannot check '") + event + "': " + exc.what();
  } catch (std::exception& exc) {
    reason = std::string("cannot check '") + event + "': " + exc.what();
  }
  if (reason.empty()) return 0;
  KJ_LOG(INFO, "Denied", event, reason);
  PyErr_SetString(forbidden_access, reason.c_str());
  return -1;
}

}  // namespace

void AuditGuard::Install() {
  if (forbidden_access != nullptr) return;
  forbidden_access = ForbiddenAccessType().release().ptr();
  KJ_REQUIRE(PySys_AddAuditHook(Hook, nullptr) == 0,
             "unable to install the audit hook");
}

AuditGuard::Scope::Scope(GuardPolicy policy) : policy_(std::move(policy)) {
  KJ_REQUIRE(forbidden_access != nullptr, "audit hook not installed");
  KJ_REQUIRE(active_scope == nullptr, "guard scopes can not be nested");
  active_scope = this;
}

AuditGuard::Scope::~Scope() { active_scope = nullptr; }

}  // namespace sandbox
