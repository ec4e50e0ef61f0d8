#include "sandbox/allowlist.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

// NOLINTNEXTLINE
TEST(AllowedModules, ExactName) {
  sandbox::AllowedModules allowed({"math", "numpy"});
  EXPECT_TRUE(allowed.Allows("math"));
  EXPECT_TRUE(allowed.Allows("numpy"));
  EXPECT_FALSE(allowed.Allows("socket"));
  EXPECT_FALSE(allowed.Allows("os"));
}

// NOLINTNEXTLINE
TEST(AllowedModules, Submodule) {
  sandbox::AllowedModules allowed({"numpy", "matplotlib"});
  EXPECT_TRUE(allowed.Allows("numpy.linalg"));
  EXPECT_TRUE(allowed.Allows("matplotlib.pyplot"));
  EXPECT_FALSE(allowed.Allows("numpyx"));
  EXPECT_FALSE(allowed.Allows("mat"));
}

// NOLINTNEXTLINE
TEST(AllowedModules, ParentOfAllowedIsDenied) {
  sandbox::AllowedModules allowed({"os.path"});
  EXPECT_TRUE(allowed.Allows("os.path"));
  EXPECT_FALSE(allowed.Allows("os"));
}

// NOLINTNEXTLINE
TEST(AllowedModules, MalformedNames) {
  sandbox::AllowedModules allowed({"math"});
  EXPECT_FALSE(allowed.Allows(""));
  EXPECT_FALSE(allowed.Allows(".math"));
  EXPECT_FALSE(allowed.Allows("math."));
  EXPECT_FALSE(allowed.Allows("math..x"));
}

// NOLINTNEXTLINE
TEST(AllowedModules, IgnoresBlankEntries) {
  sandbox::AllowedModules allowed({" math ", "", "  "});
  EXPECT_THAT(allowed.Names(), ElementsAre("math"));
  EXPECT_FALSE(allowed.Allows(""));
}

// NOLINTNEXTLINE
TEST(AllowedModules, DefaultsHaveNoIo) {
  auto defaults = sandbox::DefaultAllowedModules();
  EXPECT_THAT(defaults, Contains("math"));
  EXPECT_THAT(defaults, Contains("numpy"));
  for (const char* module :
       {"os", "sys", "socket", "subprocess", "io", "shutil", "ctypes",
        "pathlib", "importlib", "builtins", "pickle", "urllib"}) {
    EXPECT_THAT(defaults, Not(Contains(module)));
  }
}

// NOLINTNEXTLINE
TEST(AllowedModules, DefaultsHaveNoAttributeLookups) {
  // operator.attrgetter and string.Formatter().get_field act like getattr.
  auto defaults = sandbox::DefaultAllowedModules();
  EXPECT_THAT(defaults, Not(Contains("operator")));
  EXPECT_THAT(defaults, Not(Contains("string")));
  sandbox::AllowedModules allowed(defaults);
  EXPECT_FALSE(allowed.Allows("operator"));
  EXPECT_FALSE(allowed.Allows("string"));
}

}  // namespace
