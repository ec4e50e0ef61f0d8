#include "sandbox/output_buffer.hpp"
#include "gtest/gtest.h"

namespace {

// "é" is two bytes, "€" is three.
const std::string kEuro = "\xe2\x82\xac";

// NOLINTNEXTLINE
TEST(Utf8SafePrefix, FitsEntirely) {
  std::string s = "hello";
  EXPECT_EQ(sandbox::Utf8SafePrefix(s.data(), s.size(), 10), 5);
  EXPECT_EQ(sandbox::Utf8SafePrefix(s.data(), s.size(), 5), 5);
}

// NOLINTNEXTLINE
TEST(Utf8SafePrefix, BacksOffToSequenceStart) {
  std::string s = "ab" + kEuro + "cd";
  EXPECT_EQ(sandbox::Utf8SafePrefix(s.data(), s.size(), 2), 2);
  EXPECT_EQ(sandbox::Utf8SafePrefix(s.data(), s.size(), 3), 2);
  EXPECT_EQ(sandbox::Utf8SafePrefix(s.data(), s.size(), 4), 2);
  EXPECT_EQ(sandbox::Utf8SafePrefix(s.data(), s.size(), 5), 5);
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, KeepsEverythingUnderLimit) {
  sandbox::BoundedBuffer buffer(16);
  buffer.Append("15\n");
  buffer.Append("done\n");
  EXPECT_EQ(buffer.Data(), "15\ndone\n");
  EXPECT_FALSE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, ExactLimitIsNotTruncated) {
  sandbox::BoundedBuffer buffer(4);
  buffer.Append("abcd");
  EXPECT_EQ(buffer.Data(), "abcd");
  EXPECT_FALSE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, DropsOverflow) {
  sandbox::BoundedBuffer buffer(4);
  buffer.Append("abc");
  buffer.Append("defg");
  buffer.Append("h");
  EXPECT_EQ(buffer.Data(), "abcd");
  EXPECT_TRUE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, NeverSplitsSequence) {
  sandbox::BoundedBuffer buffer(4);
  buffer.Append("ab" + kEuro);
  EXPECT_EQ(buffer.Data(), "ab");
  EXPECT_TRUE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, SequenceSplitAcrossChunks) {
  sandbox::BoundedBuffer buffer(4);
  buffer.Append("ab" + kEuro.substr(0, 2));
  buffer.Append(kEuro.substr(2));
  EXPECT_EQ(buffer.Data(), "ab");
  EXPECT_TRUE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(BoundedBuffer, ZeroLimit) {
  sandbox::BoundedBuffer buffer(0);
  buffer.Append("");
  EXPECT_FALSE(buffer.Truncated());
  buffer.Append("x");
  EXPECT_EQ(buffer.Data(), "");
  EXPECT_TRUE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(TailBuffer, KeepsLastBytes) {
  sandbox::TailBuffer buffer(5);
  std::string first = "Traceback";
  std::string second = " boom";
  buffer.Append(first.data(), first.size());
  EXPECT_EQ(buffer.Data(), "eback");
  buffer.Append(second.data(), second.size());
  EXPECT_EQ(buffer.Data(), " boom");
}

}  // namespace
