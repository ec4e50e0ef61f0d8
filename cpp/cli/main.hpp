#ifndef CLI_MAIN_HPP
#define CLI_MAIN_HPP
#include <kj/main.h>
#include <string>

namespace cli {

// The "run" subcommand: runs one snippet from a file or stdin and prints the
// result as JSON.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity SetSource(kj::StringPtr path);

  kj::ProcessContext& context;
  std::string source_path;
};
}  // namespace cli
#endif
