#include "sandbox/value_json.hpp"

#include <capnp/message.h>
#include <kj/exception.h>
#include <limits>
#include "gtest/gtest.h"

namespace {

std::string RoundTrip(const std::string& json) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnproto::Value>();
  sandbox::DecodeValue(json, value);
  return sandbox::EncodeValue(value.asReader());
}

// NOLINTNEXTLINE
TEST(ValueJson, EncodePrimitives) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnproto::Value>();
  value.setInteger(5);
  EXPECT_EQ(sandbox::EncodeValue(value), "5");
  value.setBoolean(true);
  EXPECT_EQ(sandbox::EncodeValue(value), "true");
  value.setNone();
  EXPECT_EQ(sandbox::EncodeValue(value), "null");
  value.setText("15\n");
  EXPECT_EQ(sandbox::EncodeValue(value), "\"15\\n\"");
  value.setNumber(2.5);
  EXPECT_EQ(sandbox::EncodeValue(value), "2.5");
}

// NOLINTNEXTLINE
TEST(ValueJson, EncodeContainers) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnproto::Value>();
  auto mapping = value.initMapping(2);
  mapping[0].setKey("a");
  auto list = mapping[0].initValue().initList(3);
  list[0].setInteger(1);
  list[1].setInteger(2);
  list[2].setInteger(3);
  mapping[1].setKey("b");
  mapping[1].initValue().setNone();
  EXPECT_EQ(sandbox::EncodeValue(value), "{\"a\":[1,2,3],\"b\":null}");
}

// NOLINTNEXTLINE
TEST(ValueJson, LargeIntegersBecomeText) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnproto::Value>();
  value.setInteger(std::numeric_limits<int64_t>::max());
  EXPECT_EQ(sandbox::EncodeValue(value), "\"9223372036854775807\"");
  value.setInteger(sandbox::kMaxJsonInteger);
  EXPECT_EQ(sandbox::EncodeValue(value), "9007199254740992");
}

// NOLINTNEXTLINE
TEST(ValueJson, NonFiniteNumbersBecomeText) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnproto::Value>();
  value.setNumber(std::numeric_limits<double>::quiet_NaN());
  EXPECT_EQ(sandbox::EncodeValue(value), "\"nan\"");
  value.setNumber(-std::numeric_limits<double>::infinity());
  EXPECT_EQ(sandbox::EncodeValue(value), "\"-inf\"");
}

// NOLINTNEXTLINE
TEST(ValueJson, DecodeIntegralNumbers) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnproto::Value>();
  sandbox::DecodeValue("[1, 2.5, -3]", value);
  auto list = value.asReader().getList();
  ASSERT_EQ(list.size(), 3);
  EXPECT_EQ(list[0].which(), capnproto::Value::INTEGER);
  EXPECT_EQ(list[0].getInteger(), 1);
  EXPECT_EQ(list[1].which(), capnproto::Value::NUMBER);
  EXPECT_DOUBLE_EQ(list[1].getNumber(), 2.5);
  EXPECT_EQ(list[2].getInteger(), -3);
}

// NOLINTNEXTLINE
TEST(ValueJson, DecodeObject) {
  EXPECT_EQ(RoundTrip("{ \"name\" : \"x\", \"nested\": {\"ok\": false} }"),
            "{\"name\":\"x\",\"nested\":{\"ok\":false}}");
}

// NOLINTNEXTLINE
TEST(ValueJson, DecodeMalformed) {
  capnp::MallocMessageBuilder message;
  auto value = message.initRoot<capnproto::Value>();
  EXPECT_THROW(sandbox::DecodeValue("[1, 2", value), kj::Exception);
  EXPECT_THROW(sandbox::DecodeValue("{\"a\": }", value), kj::Exception);
}

}  // namespace
