#include "sandbox/value_json.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <cmath>

namespace sandbox {

void ValueToJson(capnproto::Value::Reader value,
                 capnp::JsonValue::Builder json) {
  switch (value.which()) {
    case capnproto::Value::NONE:
      json.setNull();
      break;
    case capnproto::Value::BOOLEAN:
      json.setBoolean(value.getBoolean());
      break;
    case capnproto::Value::INTEGER: {
      int64_t i = value.getInteger();
      if (i > kMaxJsonInteger || i < -kMaxJsonInteger) {
        json.setString(kj::str(i));
      } else {
        json.setNumber(static_cast<double>(i));
      }
      break;
    }
    case capnproto::Value::NUMBER: {
      double d = value.getNumber();
      if (std::isnan(d)) {
        json.setString("nan");
      } else if (std::isinf(d)) {
        json.setString(d > 0 ? "inf" : "-inf");
      } else {
        json.setNumber(d);
      }
      break;
    }
    case capnproto::Value::TEXT:
      json.setString(value.getText());
      break;
    case capnproto::Value::LIST: {
      auto items = value.getList();
      auto array = json.initArray(items.size());
      for (size_t i = 0; i < items.size(); i++) {
        ValueToJson(items[i], array[i]);
      }
      break;
    }
    case capnproto::Value::MAPPING: {
      auto entries = value.getMapping();
      auto object = json.initObject(entries.size());
      for (size_t i = 0; i < entries.size(); i++) {
        object[i].setName(entries[i].getKey());
        ValueToJson(entries[i].getValue(), object[i].initValue());
      }
      break;
    }
  }
}

void JsonToValue(capnp::JsonValue::Reader json,
                 capnproto::Value::Builder value) {
  switch (json.which()) {
    case capnp::JsonValue::NULL_:
      value.setNone();
      break;
    case capnp::JsonValue::BOOLEAN:
      value.setBoolean(json.getBoolean());
      break;
    case capnp::JsonValue::NUMBER: {
      double d = json.getNumber();
      if (std::isfinite(d) && std::trunc(d) == d &&
          std::fabs(d) <= static_cast<double>(kMaxJsonInteger)) {
        value.setInteger(static_cast<int64_t>(d));
      } else {
        value.setNumber(d);
      }
      break;
    }
    case capnp::JsonValue::STRING:
      value.setText(json.getString());
      break;
    case capnp::JsonValue::ARRAY: {
      auto items = json.getArray();
      auto list = value.initList(items.size());
      for (size_t i = 0; i < items.size(); i++) {
        JsonToValue(items[i], list[i]);
      }
      break;
    }
    case capnp::JsonValue::OBJECT: {
      auto fields = json.getObject();
      auto mapping = value.initMapping(fields.size());
      for (size_t i = 0; i < fields.size(); i++) {
        mapping[i].setKey(fields[i].getName());
        JsonToValue(fields[i].getValue(), mapping[i].initValue());
      }
      break;
    }
    default:
      KJ_FAIL_REQUIRE("unsupported JSON construct");
  }
}

std::string EncodeValue(capnproto::Value::Reader value) {
  capnp::MallocMessageBuilder message;
  auto json = message.initRoot<capnp::JsonValue>();
  ValueToJson(value, json);
  capnp::JsonCodec codec;
  return codec.encodeRaw(json.asReader()).cStr();
}

void DecodeValue(kj::StringPtr text, capnproto::Value::Builder value) {
  capnp::MallocMessageBuilder message;
  auto json = message.initRoot<capnp::JsonValue>();
  capnp::JsonCodec codec;
  codec.decodeRaw(text, json);
  JsonToValue(json.asReader(), value);
}

}  // namespace sandbox
