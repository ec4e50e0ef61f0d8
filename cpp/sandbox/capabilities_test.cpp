#include "sandbox/capabilities.hpp"

#include <kj/exception.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/module_view.hpp"

namespace {

using ::testing::Contains;
using ::testing::Not;

using sandbox::AllowedModules;
using sandbox::Capabilities;
using sandbox::Capability;
using sandbox::CapabilityKind;
using sandbox::CapabilitySet;

// NOLINTNEXTLINE
TEST(Capabilities, ContainsPureBuiltins) {
  const CapabilitySet& set = Capabilities::Build();
  for (const char* name : {"print", "len", "range", "int", "float", "str",
                           "list", "dict", "isinstance", "sorted", "sum"}) {
    EXPECT_TRUE(set.Contains(name)) << name;
  }
  EXPECT_THAT(set.Names(), Contains("ZeroDivisionError"));
  EXPECT_THAT(set.Names(), Contains("__build_class__"));
}

// NOLINTNEXTLINE
TEST(Capabilities, NeverContainsEscapeHatches) {
  const CapabilitySet& set = Capabilities::Build();
  for (const char* name :
       {"open", "eval", "exec", "compile", "getattr", "setattr", "delattr",
        "globals", "locals", "vars", "input", "__import__", "breakpoint",
        "help", "exit", "quit", "memoryview", "__loader__", "__spec__"}) {
    EXPECT_FALSE(set.Contains(name)) << name;
  }
}

// NOLINTNEXTLINE
TEST(Capabilities, LibraryEntryPoints) {
  const CapabilitySet& set = Capabilities::Build();
  const Capability* np = set.Find("np");
  ASSERT_NE(np, nullptr);
  EXPECT_EQ(np->kind, CapabilityKind::kLibrary);
  EXPECT_EQ(np->module, "numpy");
  const Capability* plt = set.Find("plt");
  ASSERT_NE(plt, nullptr);
  EXPECT_EQ(plt->module, "matplotlib.pyplot");
  EXPECT_EQ(set.Find("os"), nullptr);
}

// NOLINTNEXTLINE
TEST(Capabilities, PreboundModules) {
  const CapabilitySet& set = Capabilities::Build();
  for (const char* name : {"math", "random", "datetime", "json", "re",
                           "collections", "itertools", "functools",
                           "matplotlib"}) {
    const Capability* module = set.Find(name);
    ASSERT_NE(module, nullptr) << name;
    EXPECT_EQ(module->kind, CapabilityKind::kLibrary);
    EXPECT_EQ(module->module, name);
    EXPECT_EQ(module->attribute, "");
  }
}

// NOLINTNEXTLINE
TEST(Capabilities, BuiltOnce) {
  EXPECT_EQ(&Capabilities::Build(), &Capabilities::Build());
}

// NOLINTNEXTLINE
TEST(Capabilities, DuplicateNames) {
  std::vector<Capability> entries = {
      {"len", CapabilityKind::kBuiltin, "builtins", "len"},
      {"len", CapabilityKind::kBuiltin, "builtins", "len"}};
  EXPECT_THROW(CapabilitySet{entries}, kj::Exception);
}

// NOLINTNEXTLINE
TEST(Capabilities, Materialize) {
  pybind11::object marker = pybind11::cpp_function([]() { return 42; });
  pybind11::dict builtins = Capabilities::Materialize(
      Capabilities::Build(), marker,
      std::make_shared<const AllowedModules>(
          sandbox::DefaultAllowedModules()));
  EXPECT_TRUE(builtins.contains("print"));
  EXPECT_TRUE(builtins.contains("Ellipsis"));
  EXPECT_FALSE(builtins.contains("open"));
  EXPECT_FALSE(builtins.contains("eval"));
  EXPECT_TRUE(builtins["__import__"].is(marker));
  pybind11::object len = pybind11::module::import("builtins").attr("len");
  EXPECT_TRUE(builtins["len"].is(len));
  for (const char* name : {"np", "pd", "plt", "math", "json"}) {
    ASSERT_TRUE(builtins.contains(name)) << name;
    EXPECT_TRUE(pybind11::isinstance<sandbox::ModuleView>(builtins[name]))
        << name;
  }
  EXPECT_EQ(builtins["math"].attr("sqrt")(16).cast<double>(), 4.0);
}

// NOLINTNEXTLINE
TEST(Capabilities, MaterializeSkipsMissingLibraries) {
  CapabilitySet set({{"len", CapabilityKind::kBuiltin, "builtins", "len"},
                     {"nope", CapabilityKind::kLibrary,
                      "module_that_does_not_exist", ""}});
  pybind11::dict builtins = Capabilities::Materialize(
      set, pybind11::none(),
      std::make_shared<const AllowedModules>(std::vector<std::string>()));
  EXPECT_TRUE(builtins.contains("len"));
  EXPECT_FALSE(builtins.contains("nope"));
}

}  // namespace
