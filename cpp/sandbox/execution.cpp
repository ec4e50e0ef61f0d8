#include "sandbox/execution.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include "sandbox/allowlist.hpp"
#include "util/flags.hpp"

namespace sandbox {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "None";
    case ErrorKind::SYNTAX_ERROR:
      return "SyntaxError";
    case ErrorKind::IMPORT_DENIED:
      return "ImportDenied";
    case ErrorKind::FORBIDDEN_ACCESS:
      return "ForbiddenAccess";
    case ErrorKind::NAME_ERROR:
      return "NameError";
    case ErrorKind::RUNTIME_ERROR:
      return "RuntimeError";
    case ErrorKind::TIMEOUT:
      return "Timeout";
    case ErrorKind::RESOURCE_LIMIT:
      return "ResourceLimit";
    case ErrorKind::INVALID_REQUEST:
      return "InvalidRequest";
    case ErrorKind::INTERNAL_ERROR:
      return "InternalError";
  }
  return "InternalError";
}

Options::Options() : allowed_modules(DefaultAllowedModules()) {}

Options Options::FromFlags() {
  Options options;
  options.worker_executable = Flags::worker_executable;
  options.output_directory = Flags::output_directory;
  if (!Flags::allowed_modules.empty()) {
    options.allowed_modules = Flags::allowed_modules;
  }
  options.read_roots = Flags::read_roots;
  options.default_timeout = std::chrono::milliseconds(Flags::timeout_millis);
  options.startup_timeout =
      std::chrono::milliseconds(Flags::startup_timeout_millis);
  options.max_output_bytes = Flags::max_output_bytes;
  options.memory_limit_kb = Flags::memory_limit_kb;
  options.max_file_size_kb = Flags::max_file_size_kb;
  options.temp_directory = Flags::temp_directory;
  return options;
}

std::string ToJson(const ExecutionResult& result) {
  capnp::MallocMessageBuilder message;
  capnp::JsonCodec codec;
  auto root = message.initRoot<capnp::JsonValue>();
  auto fields = root.initObject(14);
  size_t pos = 0;
  auto field = [&fields, &pos](const char* name) {
    auto f = fields[pos++];
    f.setName(name);
    return f.initValue();
  };
  auto set_strings = [](capnp::JsonValue::Builder value,
                        const std::vector<std::string>& strings) {
    auto array = value.initArray(strings.size());
    for (size_t i = 0; i < strings.size(); i++) {
      array[i].setString(strings[i]);
    }
  };

  field("success").setBoolean(result.success);
  field("stdout").setString(result.stdout_text);
  field("stderr").setString(result.stderr_text);
  field("stdout_truncated").setBoolean(result.stdout_truncated);
  field("stderr_truncated").setBoolean(result.stderr_truncated);

  auto error = field("error");
  if (result.error_kind == ErrorKind::NONE) {
    error.setNull();
  } else {
    auto error_fields = error.initObject(4);
    error_fields[0].setName("kind");
    error_fields[0].initValue().setString(ErrorKindName(result.error_kind));
    error_fields[1].setName("category");
    error_fields[1].initValue().setString(result.error_category);
    error_fields[2].setName("message");
    error_fields[2].initValue().setString(result.error_message);
    error_fields[3].setName("detail");
    error_fields[3].initValue().setString(result.error_detail);
  }

  // Variables are already JSON text; parse them back so that they are
  // embedded as values rather than as strings.
  auto variables = field("variables").initObject(
      result.produced_variables.size());
  size_t i = 0;
  for (const auto& variable : result.produced_variables) {
    variables[i].setName(variable.first);
    codec.decodeRaw(kj::StringPtr(variable.second.c_str()),
                    variables[i].initValue());
    i++;
  }

  auto value = field("value");
  if (result.value.empty()) {
    value.setNull();
  } else {
    codec.decodeRaw(kj::StringPtr(result.value.c_str()), value);
  }

  set_strings(field("serialization_fallbacks"),
              result.serialization_fallbacks);
  set_strings(field("artifacts"), result.artifact_paths);
  field("elapsed_ms").setNumber(result.elapsed.count());
  field("startup_ms").setNumber(result.startup.count());
  field("cpu_ms").setNumber(result.cpu_time.count());
  field("memory_kb").setNumber(result.memory_usage_kb);
  KJ_ASSERT(pos == fields.size());
  return codec.encodeRaw(root.asReader()).cStr();
}

}  // namespace sandbox
