#ifndef SANDBOX_SERIALIZER_HPP
#define SANDBOX_SERIALIZER_HPP

#include <memory>
#include <string>
#include <vector>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

#include "capnp/sandbox.capnp.h"

namespace sandbox {

class Serializer;

// One step of the conversion from Python objects to Values. Converters are
// tried in order; the first one that accepts an object produces its value.
class Converter {
 public:
  virtual ~Converter() = default;
  // Returns false if obj is not handled by this converter. May raise
  // pybind11::error_already_set, in which case the object is rendered as
  // text.
  virtual bool Convert(pybind11::handle obj, capnproto::Value::Builder value,
                       int depth, Serializer* serializer) const = 0;
};

class Serializer {
 public:
  // Deeper values are rendered as text.
  static const constexpr int kMaxDepth = 32;

  Serializer();

  // Converts obj into value. Never throws: objects that cannot be converted
  // are rendered as text, and FellBack() becomes true.
  void Convert(pybind11::handle obj, capnproto::Value::Builder value,
               int depth = 0);

  // Converts the variables left in globals by a snippet. Interpreter
  // bookkeeping, modules and module views are skipped.
  void CollectVariables(const pybind11::dict& globals,
                        capnproto::ExecutionReport::Builder report);

  // Renders obj as text, without addresses for functions and classes.
  static std::string StableText(pybind11::handle obj);

  // Marks the current value as converted to text somewhere.
  void MarkFallback() { fell_back_ = true; }
  bool FellBack() const { return fell_back_; }
  void Reset() { fell_back_ = false; }

 private:
  std::vector<std::unique_ptr<Converter>> converters_;
  bool fell_back_ = false;
};

// Builds the Python object for a value received from the host.
pybind11::object ToPython(capnproto::Value::Reader value);

}  // namespace sandbox

#endif
