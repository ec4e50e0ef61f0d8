#include "cli/main.hpp"
#include "sandbox/main.hpp"
#include "util/version.hpp"

class ScriptSandboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit ScriptSandboxMain(kj::ProcessContext& context)
      : context(context), rm(&context), wm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Script Sandbox (" + util::version + ")",
                           "Runs untrusted Python snippets")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain), "run a snippet")
        .addSubCommand("worker", KJ_BIND_METHOD(wm, getMain),
                       "run the worker (internal)")
        .build();
  }

 private:
  kj::ProcessContext& context;
  cli::Main rm;
  sandbox::Main wm;
};

KJ_MAIN(ScriptSandboxMain);
