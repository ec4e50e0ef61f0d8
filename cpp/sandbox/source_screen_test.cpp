#include "sandbox/source_screen.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

using sandbox::ScreenAttributes;
using sandbox::ScreenSource;

// NOLINTNEXTLINE
TEST(SourceScreen, PlainCode) {
  std::string reason;
  EXPECT_TRUE(ScreenSource("x = 5\ny = 10\nprint(x + y)\n", &reason));
  EXPECT_TRUE(ScreenSource("def f(a):\n    return [i * a for i in range(3)]\n",
                           &reason));
  EXPECT_EQ(reason, "");
}

// NOLINTNEXTLINE
TEST(SourceScreen, ClassesWithConstructors) {
  std::string reason;
  EXPECT_TRUE(ScreenSource(
      "class Point:\n"
      "    def __init__(self, x):\n"
      "        self.x = x\n"
      "p = Point(1)\n"
      "name = Point.__name__\n",
      &reason))
      << reason;
}

// NOLINTNEXTLINE
TEST(SourceScreen, MainCheck) {
  std::string reason;
  EXPECT_TRUE(ScreenSource("if __name__ == '__main__':\n    pass\n", &reason))
      << reason;
}

// NOLINTNEXTLINE
TEST(SourceScreen, DunderAttribute) {
  std::string reason;
  EXPECT_FALSE(ScreenSource("x = 1\ny = ().__class__\n", &reason));
  EXPECT_THAT(reason, HasSubstr("__class__"));
  EXPECT_THAT(reason, HasSubstr("line 2"));
}

// NOLINTNEXTLINE
TEST(SourceScreen, DunderName) {
  std::string reason;
  EXPECT_FALSE(ScreenSource("b = __builtins__\n", &reason));
  EXPECT_THAT(reason, HasSubstr("__builtins__"));
  EXPECT_FALSE(ScreenSource("__loader__\n", &reason));
}

// NOLINTNEXTLINE
TEST(SourceScreen, FrameAttributes) {
  std::string reason;
  EXPECT_FALSE(ScreenSource(
      "def g():\n    yield 1\nf = g().gi_frame\n", &reason));
  EXPECT_THAT(reason, HasSubstr("gi_frame"));
}

// NOLINTNEXTLINE
TEST(SourceScreen, DunderStringConstant) {
  std::string reason;
  EXPECT_FALSE(ScreenSource("name = '__subclasses__'\n", &reason));
  EXPECT_THAT(reason, HasSubstr("__subclasses__"));
}

// NOLINTNEXTLINE
TEST(SourceScreen, FormatStringWalkingAttributes) {
  std::string reason;
  EXPECT_FALSE(ScreenSource("s = '{0._secret}'.format(obj)\n", &reason));
  EXPECT_FALSE(ScreenSource("s = '{x[_y]}'.format(x=obj)\n", &reason));
  EXPECT_TRUE(ScreenSource("s = '{0:.2f} {1}'.format(1.5, 'a')\n", &reason))
      << reason;
}

// NOLINTNEXTLINE
TEST(SourceScreen, PrivateAttributes) {
  std::string reason;
  EXPECT_FALSE(ScreenSource("f = m.subprocess._fork_exec\n", &reason));
  EXPECT_THAT(reason, HasSubstr("_fork_exec"));
  EXPECT_FALSE(ScreenSource("self._x = 1\n", &reason));
  EXPECT_THAT(reason, HasSubstr("_x"));
}

// NOLINTNEXTLINE
TEST(SourceScreen, NamedTupleHelpers) {
  std::string reason;
  EXPECT_TRUE(ScreenSource(
      "import collections\n"
      "P = collections.namedtuple('P', 'x y')\n"
      "d = P(1, 2)._asdict()\n"
      "q = P(1, 2)._replace(x=3)\n"
      "f = P._fields\n",
      &reason))
      << reason;
}

// NOLINTNEXTLINE
TEST(SourceScreen, PrivateImports) {
  std::string reason;
  EXPECT_FALSE(ScreenSource("import _posixsubprocess\n", &reason));
  EXPECT_THAT(reason, HasSubstr("_posixsubprocess"));
  EXPECT_FALSE(ScreenSource("from numpy import _core\n", &reason));
  EXPECT_FALSE(ScreenSource("from numpy._core import multiarray\n", &reason));
  EXPECT_TRUE(ScreenSource("from math import *\nimport numpy.linalg\n",
                           &reason))
      << reason;
}

// NOLINTNEXTLINE
TEST(SourceScreen, AttributesOnly) {
  std::string reason;
  EXPECT_FALSE(ScreenAttributes("a._values > 0", &reason));
  EXPECT_THAT(reason, HasSubstr("_values"));
  EXPECT_FALSE(ScreenAttributes("x.f_globals", &reason));
  EXPECT_TRUE(ScreenAttributes("__pd_eval_local_x + a.b", &reason)) << reason;
  EXPECT_TRUE(ScreenAttributes("import _thread", &reason)) << reason;
  EXPECT_TRUE(ScreenAttributes("x = (", &reason));
}

}  // namespace
