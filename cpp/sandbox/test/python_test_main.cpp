// Main of the tests that need an interpreter. The interpreter lives for the
// whole test binary, as in the worker.

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#pragma GCC diagnostic pop

#include "gmock/gmock.h"
#include "gtest/gtest.h"

int main(int argc, char** argv) {
  ::testing::InitGoogleMock(&argc, argv);
  pybind11::scoped_interpreter interpreter;
  return RUN_ALL_TESTS();
}
