#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <kj/main.h>

namespace sandbox {

// The "worker" subcommand: reads one request on the request channel, runs
// it in an embedded interpreter and writes the report. Started by Session,
// never by hand.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace sandbox
#endif
