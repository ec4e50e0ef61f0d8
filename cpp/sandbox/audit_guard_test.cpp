#include "sandbox/audit_guard.hpp"

#include <kj/exception.h>
#include <fstream>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/eval.h>
#pragma GCC diagnostic pop

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/runtime_module.hpp"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/script_sandbox_testdir";

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using sandbox::AuditGuard;
using sandbox::GuardPolicy;

class AuditGuardTest : public ::testing::Test {
 protected:
  AuditGuardTest() : output_(test_tmpdir) {}

  void SetUp() override {
    AuditGuard::Install();
    policy_.output_directory = util::File::RealPath(output_.Path());
    globals_["os"] = pybind11::module::import("os");
    globals_["socket"] = pybind11::module::import("socket");
    globals_["out"] = policy_.output_directory;
  }

  // Runs code and returns the error it raised, if it was ForbiddenAccess.
  std::string Forbidden(const char* code) {
    try {
      pybind11::exec(code, globals_);
    } catch (pybind11::error_already_set& exc) {
      if (exc.matches(sandbox::ForbiddenAccessType())) return exc.what();
      throw;
    }
    return "";
  }

  util::TempDir output_;
  GuardPolicy policy_;
  pybind11::dict globals_;
};

// NOLINTNEXTLINE
TEST(AuditGuard, DeniedEvents) {
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("socket.connect"));
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("socket.__new__"));
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("subprocess.Popen"));
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("os.system"));
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("os.remove"));
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("ctypes.dlopen"));
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("shutil.rmtree"));
  EXPECT_TRUE(AuditGuard::IsDeniedEvent("sys.settrace"));
  EXPECT_FALSE(AuditGuard::IsDeniedEvent("open"));
  EXPECT_FALSE(AuditGuard::IsDeniedEvent("import"));
  EXPECT_FALSE(AuditGuard::IsDeniedEvent("compile"));
  EXPECT_FALSE(AuditGuard::IsDeniedEvent("os.systemx"));
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, WriteInsideOutputDirectory) {
  AuditGuard::Scope scope(policy_);
  EXPECT_EQ(Forbidden("with open(out + '/a.txt', 'w') as f:\n"
                      "    f.write('hello')\n"
                      "with open(out + '/a.txt', 'a') as f:\n"
                      "    f.write('!')\n"),
            "");
  EXPECT_THAT(scope.WrittenFiles(),
              ElementsAre(util::File::JoinPath(policy_.output_directory,
                                               "a.txt")));
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, ReadBackFromOutputDirectory) {
  std::ofstream(util::File::JoinPath(output_.Path(), "in.txt")) << "data";
  AuditGuard::Scope scope(policy_);
  EXPECT_EQ(Forbidden("data = open(out + '/in.txt').read()\n"), "");
  EXPECT_EQ(globals_["data"].cast<std::string>(), "data");
  EXPECT_THAT(scope.WrittenFiles(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, WriteOutsideOutputDirectory) {
  AuditGuard::Scope scope(policy_);
  std::string error =
      Forbidden("open('/tmp/script_sandbox_testdir/escape.txt', 'w')\n");
  EXPECT_THAT(error, HasSubstr("escape.txt"));
  EXPECT_NE(Forbidden("open(out + '/../escape.txt', 'w')\n"), "");
  EXPECT_NE(Forbidden("os.open('/tmp/x', os.O_WRONLY | os.O_CREAT)\n"), "");
  EXPECT_THAT(scope.WrittenFiles(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, ReadOutsideRoots) {
  AuditGuard::Scope scope(policy_);
  EXPECT_THAT(Forbidden("open('/etc/passwd').read()\n"),
              HasSubstr("/etc/passwd"));
  EXPECT_NE(Forbidden("os.listdir('/')\n"), "");
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, ReadRoots) {
  policy_.read_roots.push_back(util::File::RealPath("/etc"));
  AuditGuard::Scope scope(policy_);
  EXPECT_EQ(Forbidden("open('/etc/passwd').close()\n"), "");
  EXPECT_EQ(Forbidden("open('/dev/null').close()\n"), "");
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, ProcessesAndNetwork) {
  AuditGuard::Scope scope(policy_);
  EXPECT_NE(Forbidden("os.system('true')\n"), "");
  EXPECT_NE(Forbidden("socket.socket()\n"), "");
  EXPECT_NE(Forbidden("os.remove(out + '/nothing')\n"), "");
  EXPECT_NE(Forbidden("os.chdir('/')\n"), "");
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, CaughtAsPermissionError) {
  AuditGuard::Scope scope(policy_);
  pybind11::exec(
      "try:\n"
      "    open('/etc/passwd')\n"
      "    denied = False\n"
      "except PermissionError:\n"
      "    denied = True\n",
      globals_);
  EXPECT_TRUE(globals_["denied"].cast<bool>());
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, DormantOutsideScope) {
  { AuditGuard::Scope scope(policy_); }
  EXPECT_EQ(Forbidden("open('/etc/passwd').close()\n"), "");
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, ScopesDoNotNest) {
  AuditGuard::Scope scope(policy_);
  EXPECT_THROW(AuditGuard::Scope{policy_}, kj::Exception);
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, DirectoriesAreNotArtifacts) {
  AuditGuard::Scope scope(policy_);
  std::string inside =
      util::File::JoinPath(policy_.output_directory, "plots");
  pybind11::tuple args = pybind11::make_tuple(inside, 0777, -1);
  EXPECT_EQ(scope.Check("os.mkdir", args.ptr()), "");
  EXPECT_THAT(scope.WrittenFiles(), IsEmpty());
  pybind11::tuple outside = pybind11::make_tuple("/tmp/plots", 0777, -1);
  EXPECT_NE(scope.Check("os.mkdir", outside.ptr()), "");
  EXPECT_NE(scope.Check("os.remove", nullptr), "");
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, CompiledCodeIsScreened) {
  AuditGuard::Scope scope(policy_);
  EXPECT_THAT(Forbidden("compile('x.__class__', '<query>', 'eval')\n"),
              HasSubstr("__class__"));
  EXPECT_THAT(Forbidden("compile(b'os._exit(0)', '<expr>', 'exec')\n"),
              HasSubstr("_exit"));
  EXPECT_EQ(Forbidden("code = compile('x.real + 1', '<query>', 'eval')\n"),
            "");
  EXPECT_EQ(Forbidden("import ast\n"
                      "tree = ast.parse('a.b(c)')\n"),
            "");
}

// NOLINTNEXTLINE
TEST_F(AuditGuardTest, CompileOutsideScope) {
  EXPECT_EQ(Forbidden("code = compile('x.__class__', '<query>', 'eval')\n"),
            "");
}

}  // namespace
