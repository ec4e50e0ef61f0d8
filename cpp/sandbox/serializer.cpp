#include "sandbox/serializer.hpp"

#include <kj/debug.h>
#include <set>

#include "sandbox/module_view.hpp"

namespace sandbox {

namespace {

const std::set<std::string> kBookkeeping = {"__builtins__", "__name__",
                                            "__doc__"};

class PrimitiveConverter : public Converter {
 public:
  bool Convert(pybind11::handle obj, capnproto::Value::Builder value,
               int /*depth*/, Serializer* /*serializer*/) const override {
    if (obj.is_none()) {
      value.setNone();
    } else if (PyBool_Check(obj.ptr())) {
      value.setBoolean(obj.ptr() == Py_True);
    } else if (PyLong_Check(obj.ptr())) {
      int overflow = 0;
      long long i = PyLong_AsLongLongAndOverflow(obj.ptr(), &overflow);
      if (i == -1 && PyErr_Occurred()) throw pybind11::error_already_set();
      if (overflow != 0) {
        value.setText(pybind11::str(obj).cast<std::string>());
      } else {
        value.setInteger(i);
      }
    } else if (PyFloat_Check(obj.ptr())) {
      value.setNumber(PyFloat_AsDouble(obj.ptr()));
    } else if (PyUnicode_Check(obj.ptr())) {
      value.setText(pybind11::bytes(obj.attr("encode")("utf-8", "replace"))
                        .cast<std::string>());
    } else {
      return false;
    }
    return true;
  }
};

class ContainerConverter : public Converter {
 public:
  ContainerConverter() {
    pybind11::module abc = pybind11::module::import("collections.abc");
    mapping_ = abc.attr("Mapping");
    sequence_ = abc.attr("Sequence");
    set_ = abc.attr("Set");
  }

  bool Convert(pybind11::handle obj, capnproto::Value::Builder value,
               int depth, Serializer* serializer) const override {
    if (PyBytes_Check(obj.ptr()) || PyByteArray_Check(obj.ptr()) ||
        PyUnicode_Check(obj.ptr())) {
      return false;
    }
    if (pybind11::isinstance(obj, mapping_)) {
      pybind11::list items(obj.attr("items")());
      auto entries = value.initMapping(items.size());
      for (size_t i = 0; i < items.size(); i++) {
        pybind11::tuple item(items[i]);
        pybind11::handle key = item[0];
        entries[i].setKey(PyUnicode_Check(key.ptr())
                              ? key.cast<std::string>()
                              : Serializer::StableText(key));
        serializer->Convert(item[1], entries[i].initValue(), depth + 1);
      }
      return true;
    }
    if (pybind11::isinstance(obj, sequence_) ||
        pybind11::isinstance(obj, set_)) {
      pybind11::list items(obj);
      auto list = value.initList(items.size());
      for (size_t i = 0; i < items.size(); i++) {
        serializer->Convert(items[i], list[i], depth + 1);
      }
      return true;
    }
    return false;
  }

 private:
  pybind11::object mapping_;
  pybind11::object sequence_;
  pybind11::object set_;
};

// Objects that know how to describe themselves, e.g. pandas DataFrames.
class MethodConverter : public Converter {
 public:
  explicit MethodConverter(const char* method) : method_(method) {}

  bool Convert(pybind11::handle obj, capnproto::Value::Builder value,
               int depth, Serializer* serializer) const override {
    if (PyType_Check(obj.ptr())) return false;
    if (!pybind11::hasattr(obj, method_)) return false;
    pybind11::object method = obj.attr(method_);
    if (!PyCallable_Check(method.ptr())) return false;
    serializer->Convert(method(), value, depth + 1);
    return true;
  }

 private:
  const char* method_;
};

class TextConverter : public Converter {
 public:
  bool Convert(pybind11::handle obj, capnproto::Value::Builder value,
               int /*depth*/, Serializer* serializer) const override {
    value.setText(Serializer::StableText(obj));
    serializer->MarkFallback();
    return true;
  }
};

}  // namespace

Serializer::Serializer() {
  converters_.push_back(std::make_unique<PrimitiveConverter>());
  converters_.push_back(std::make_unique<ContainerConverter>());
  converters_.push_back(std::make_unique<MethodConverter>("to_dict"));
  converters_.push_back(std::make_unique<MethodConverter>("tolist"));
  converters_.push_back(std::make_unique<TextConverter>());
}

void Serializer::Convert(pybind11::handle obj, capnproto::Value::Builder value,
                         int depth) {
  if (depth > kMaxDepth) {
    value.setText(StableText(obj));
    MarkFallback();
    return;
  }
  for (const auto& converter : converters_) {
    try {
      if (converter->Convert(obj, value, depth, this)) return;
    } catch (pybind11::error_already_set& exc) {
      KJ_LOG(INFO, "Conversion failed, rendering as text", exc.what());
      value.setText(StableText(obj));
      MarkFallback();
      return;
    }
  }
}

void Serializer::CollectVariables(const pybind11::dict& globals,
                                  capnproto::ExecutionReport::Builder report) {
  std::vector<std::pair<std::string, pybind11::handle>> variables;
  for (auto item : globals) {
    if (!PyUnicode_Check(item.first.ptr())) continue;
    std::string name = item.first.cast<std::string>();
    if (kBookkeeping.count(name)) continue;
    if (PyModule_Check(item.second.ptr()) ||
        pybind11::isinstance<ModuleView>(item.second))
      continue;
    variables.emplace_back(name, item.second);
  }
  std::vector<std::string> fallbacks;
  auto list = report.initVariables(variables.size());
  for (size_t i = 0; i < variables.size(); i++) {
    Reset();
    list[i].setName(variables[i].first);
    Convert(variables[i].second, list[i].initValue());
    if (FellBack()) fallbacks.push_back(variables[i].first);
  }
  auto fallback_list = report.initFallbacks(fallbacks.size());
  for (size_t i = 0; i < fallbacks.size(); i++) {
    fallback_list.set(i, fallbacks[i]);
  }
  Reset();
}

std::string Serializer::StableText(pybind11::handle obj) {
  try {
    PyTypeObject* type = Py_TYPE(obj.ptr());
    if (PyType_Check(obj.ptr())) {
      return "<class " + obj.attr("__qualname__").cast<std::string>() + ">";
    }
    if (PyFunction_Check(obj.ptr())) {
      return "<function " + obj.attr("__qualname__").cast<std::string>() +
             ">";
    }
    if (PyCFunction_Check(obj.ptr())) {
      return "<built-in function " +
             obj.attr("__name__").cast<std::string>() + ">";
    }
    if (type->tp_repr == PyBaseObject_Type.tp_repr &&
        type->tp_str == PyBaseObject_Type.tp_str) {
      return std::string("<") + type->tp_name + " object>";
    }
    return pybind11::bytes(
        pybind11::str(obj).attr("encode")("utf-8", "replace"));
  } catch (pybind11::error_already_set& exc) {
    KJ_LOG(INFO, "Unprintable object", exc.what());
    return std::string("<unprintable ") + Py_TYPE(obj.ptr())->tp_name + ">";
  }
}

pybind11::object ToPython(capnproto::Value::Reader value) {
  switch (value.which()) {
    case capnproto::Value::NONE:
      return pybind11::none();
    case capnproto::Value::BOOLEAN:
      return pybind11::bool_(value.getBoolean());
    case capnproto::Value::INTEGER:
      return pybind11::int_(value.getInteger());
    case capnproto::Value::NUMBER:
      return pybind11::float_(value.getNumber());
    case capnproto::Value::TEXT:
      return pybind11::str(value.getText().cStr(), value.getText().size());
    case capnproto::Value::LIST: {
      pybind11::list list;
      for (auto item : value.getList()) list.append(ToPython(item));
      return std::move(list);
    }
    case capnproto::Value::MAPPING: {
      pybind11::dict dict;
      for (auto entry : value.getMapping()) {
        dict[pybind11::str(entry.getKey().cStr(), entry.getKey().size())] =
            ToPython(entry.getValue());
      }
      return std::move(dict);
    }
  }
  KJ_UNREACHABLE;
}

}  // namespace sandbox
