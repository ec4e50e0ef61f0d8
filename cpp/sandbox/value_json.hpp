#ifndef SANDBOX_VALUE_JSON_HPP
#define SANDBOX_VALUE_JSON_HPP

#include <string>

#include <capnp/compat/json.capnp.h>
#include <kj/string.h>
#include "capnp/sandbox.capnp.h"

namespace sandbox {

// Integers with a larger magnitude than this are not exactly representable as
// JSON numbers and are rendered as decimal text instead.
static const constexpr int64_t kMaxJsonInteger = 1LL << 53;

void ValueToJson(capnproto::Value::Reader value,
                 capnp::JsonValue::Builder json);

// Throws kj::Exception if json contains something other than plain JSON.
void JsonToValue(capnp::JsonValue::Reader json,
                 capnproto::Value::Builder value);

// Renders value as compact JSON text.
std::string EncodeValue(capnproto::Value::Reader value);

// Parses JSON text into value. Throws kj::Exception on malformed input.
void DecodeValue(kj::StringPtr text, capnproto::Value::Builder value);

}  // namespace sandbox

#endif
