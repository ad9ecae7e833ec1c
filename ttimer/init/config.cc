#include "ttimer/init/config.h"

#include "absl/flags/flag.h"

ABSL_FLAG(bool, interactive, true,
          "read keys (space/p to pause, q/Esc/Ctrl+C to quit) from stdin in raw mode");

namespace ttimer {

TimerConfig ConfigFromFlags() {
  TimerConfig config;
  config.interactive = absl::GetFlag(FLAGS_interactive);
  return config;
}

}  // namespace ttimer
