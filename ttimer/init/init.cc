#include "ttimer/init/init.h"

#include <cstdlib>
#include <string>
#include <vector>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage_config.h"
#include "ttimer/init/config.h"

namespace ttimer {

void MainInit(int* argc, char*** argv) {
  absl::InitializeSymbolizer((*argv)[0]);
  absl::InstallFailureSignalHandler(absl::FailureSignalHandlerOptions());

  absl::FlagsUsageConfig usage_config;
  usage_config.version_string = [] { return std::string(kVersionString) + "\n"; };
  absl::SetFlagsUsageConfig(usage_config);

  std::vector<char*> updated = absl::ParseCommandLine(*argc, *argv);
  *argc = updated.size();
  char** new_argv = static_cast<char**>(calloc(*argc, sizeof(char*)));
  for (size_t i = 0; i < updated.size(); ++i) {
    new_argv[i] = updated[i];
  }
  *argv = new_argv;
}

}  // namespace ttimer
