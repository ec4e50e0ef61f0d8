#include "cli/main.hpp"

#include <iostream>
#include <system_error>

#include "sandbox/execution.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace cli {

kj::MainBuilder::Validity Main::SetSource(kj::StringPtr path) {
  source_path = path;
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context, "host");

  sandbox::ExecutionRequest request;
  request.language = Flags::language;
  request.expression = Flags::expression;
  for (const std::string& binding : Flags::bindings) {
    size_t pos = binding.find('=');
    if (pos == std::string::npos || pos == 0) {
      return kj::str("Invalid binding ", binding, ", expected NAME=JSON");
    }
    request.extra_bindings[binding.substr(0, pos)] = binding.substr(pos + 1);
  }
  try {
    request.source_text =
        util::File::Read(source_path == "-" ? "/dev/stdin" : source_path);
  } catch (const std::system_error& exc) {
    return kj::str(exc.what());
  }

  sandbox::Sandbox sandbox(sandbox::Options::FromFlags());
  sandbox::ExecutionResult result = sandbox.Execute(request);
  std::cout << sandbox::ToJson(result) << std::endl;
  if (!result.success) {
    context.exitError(kj::str("Execution failed: ",
                              sandbox::ErrorKindName(result.error_kind)));
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Script Sandbox (" + util::version + ")",
                         "Runs a Python snippet with restricted capabilities "
                         "and prints the result as JSON")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'t', "timeout"}, util::setUint(Flags::timeout_millis),
                        "<MILLIS>", "Time budget of the snippet")
      .addOptionWithArg({"startup-timeout"},
                        util::setUint(Flags::startup_timeout_millis),
                        "<MILLIS>", "Time budget of the worker startup")
      .addOptionWithArg({'o', "output-dir"},
                        util::setString(Flags::output_directory), "<DIR>",
                        "Directory where plots and files are written")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Directory for the worker home directories")
      .addOptionWithArg({'m', "modules"},
                        util::appendList(Flags::allowed_modules), "<MOD,...>",
                        "Modules the snippet may import, instead of the "
                        "default list")
      .addOptionWithArg({'r', "read-root"},
                        util::appendString(Flags::read_roots), "<DIR>",
                        "Extra directory the snippet may read from")
      .addOptionWithArg({'b', "bind"}, util::appendString(Flags::bindings),
                        "<NAME=JSON>", "Variable bound before the snippet runs")
      .addOptionWithArg({'l', "language"}, util::setString(Flags::language),
                        "<LANG>", "Language of the snippet, only python")
      .addOption({'e', "expression"}, util::setBool(Flags::expression),
                 "The snippet is an expression, print its value")
      .addOptionWithArg({'w', "worker"},
                        util::setString(Flags::worker_executable), "<PATH>",
                        "Binary to run as worker, instead of this one")
      .addOptionWithArg({"max-output"}, util::setUint(Flags::max_output_bytes),
                        "<BYTES>", "Cap on each captured output stream")
      .addOptionWithArg({"memory-limit"}, util::setUint(Flags::memory_limit_kb),
                        "<KB>", "Address space limit of the worker")
      .addOptionWithArg({"file-size-limit"},
                        util::setUint(Flags::max_file_size_kb), "<KB>",
                        "Size limit of files written by the worker")
      .expectArg("<FILE>", KJ_BIND_METHOD(*this, SetSource))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace cli
