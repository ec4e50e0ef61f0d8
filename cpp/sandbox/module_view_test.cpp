#include "sandbox/module_view.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/runtime_module.hpp"

namespace {

using ::testing::HasSubstr;

using sandbox::AllowedModules;
using sandbox::ForbiddenAccess;
using sandbox::ModuleView;

class ModuleViewTest : public ::testing::Test {
 protected:
  void SetUp() override { sandbox::RuntimeModule(); }

  static std::shared_ptr<const AllowedModules> Allowed(
      const std::vector<std::string>& names) {
    return std::make_shared<const AllowedModules>(names);
  }

  static ModuleView View(const char* module, const char* package,
                         const std::vector<std::string>& allowed) {
    return ModuleView(pybind11::module::import(module), package,
                      Allowed(allowed));
  }
};

// NOLINTNEXTLINE
TEST_F(ModuleViewTest, ForwardsPublicAttributes) {
  ModuleView math = View("math", "math", {"math"});
  EXPECT_NEAR(math.GetAttr("pi").cast<double>(), 3.14159, 1e-5);
  EXPECT_EQ(math.GetAttr("__name__").cast<std::string>(), "math");
  EXPECT_EQ(math.Name(), "math");
  EXPECT_EQ(math.Repr(), "<module 'math'>");
  EXPECT_THROW(math.GetAttr("no_such_name"), pybind11::error_already_set);
}

// NOLINTNEXTLINE
TEST_F(ModuleViewTest, PrivateNames) {
  ModuleView json = View("json", "json", {"json"});
  EXPECT_THROW(json.GetAttr("_default_decoder"), ForbiddenAccess);
  EXPECT_THROW(json.GetAttr("__loader__"), ForbiddenAccess);
  EXPECT_THROW(json.GetAttr("__spec__"), ForbiddenAccess);
  EXPECT_NO_THROW(json.GetAttr("__all__"));
  EXPECT_NO_THROW(json.GetAttr("__doc__"));
}

// NOLINTNEXTLINE
TEST_F(ModuleViewTest, SubmodulesOfThePackage) {
  ModuleView json = View("json", "json", {"math"});
  pybind11::object decoder = json.GetAttr("decoder");
  ASSERT_TRUE(pybind11::isinstance<ModuleView>(decoder));
  EXPECT_EQ(decoder.cast<const ModuleView&>().Name(), "json.decoder");
  try {
    decoder.cast<const ModuleView&>().GetAttr("re");
    FAIL() << "re was reached through json.decoder";
  } catch (const ForbiddenAccess& exc) {
    EXPECT_THAT(exc.what(), HasSubstr("'re'"));
    EXPECT_THAT(exc.what(), HasSubstr("json.decoder.re"));
  }
}

// NOLINTNEXTLINE
TEST_F(ModuleViewTest, AllowedModulesOutsideThePackage) {
  ModuleView decoder = View("json.decoder", "json", {"re"});
  pybind11::object re = decoder.GetAttr("re");
  ASSERT_TRUE(pybind11::isinstance<ModuleView>(re));
  EXPECT_EQ(re.cast<const ModuleView&>().Name(), "re");
}

// NOLINTNEXTLINE
TEST_F(ModuleViewTest, LookupsFromPython) {
  pybind11::object json = ModuleView::Wrap(pybind11::module::import("json"),
                                           "json", Allowed({"json"}));
  EXPECT_EQ(json.attr("dumps")(pybind11::make_tuple(1)).cast<std::string>(),
            "[1]");
  try {
    pybind11::object codecs = json.attr("codecs");
    FAIL() << "codecs was reached through json";
  } catch (pybind11::error_already_set& exc) {
    EXPECT_TRUE(exc.matches(sandbox::ForbiddenAccessType()));
  }
  EXPECT_EQ(pybind11::repr(json).cast<std::string>(), "<module 'json'>");
}

// NOLINTNEXTLINE
TEST_F(ModuleViewTest, Wrap) {
  pybind11::object value = pybind11::int_(3);
  EXPECT_TRUE(ModuleView::Wrap(value, "json", Allowed({})).is(value));
  EXPECT_THROW(ModuleView::Wrap(pybind11::module::import("os"), "json",
                                Allowed({"json"})),
               ForbiddenAccess);
  pybind11::object decoder = ModuleView::Wrap(
      pybind11::module::import("json.decoder"), "json", Allowed({}));
  EXPECT_TRUE(pybind11::isinstance<ModuleView>(decoder));
}

// NOLINTNEXTLINE
TEST_F(ModuleViewTest, NamespaceHasPublicReachableNames) {
  ModuleView json = View("json", "json", {"json"});
  pybind11::dict names = json.GetAttr("__dict__");
  EXPECT_TRUE(names.contains("loads"));
  EXPECT_TRUE(names.contains("decoder"));
  EXPECT_TRUE(pybind11::isinstance<ModuleView>(names["decoder"]));
  EXPECT_FALSE(names.contains("codecs"));
  EXPECT_FALSE(names.contains("_default_decoder"));
  EXPECT_FALSE(names.contains("__loader__"));
}

// NOLINTNEXTLINE
TEST(ModuleView, PackageOf) {
  EXPECT_EQ(ModuleView::PackageOf("matplotlib.pyplot"), "matplotlib");
  EXPECT_EQ(ModuleView::PackageOf("math"), "math");
}

}  // namespace
