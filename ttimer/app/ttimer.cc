#include <signal.h>
#include <unistd.h>

#include <iostream>
#include <memory>

#include "absl/cleanup/cleanup.h"
#include "absl/flags/usage.h"
#include "absl/memory/memory.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "ttimer/duration/format.h"
#include "ttimer/duration/parse.h"
#include "ttimer/errors/human-error.h"
#include "ttimer/init/config.h"
#include "ttimer/init/init.h"
#include "ttimer/log/spdlog.h"
#include "ttimer/posix/signal-mask.h"
#include "ttimer/term/ansi-renderer.h"
#include "ttimer/term/event-loop.h"
#include "ttimer/term/raw-mode.h"
#include "ttimer/term/session.h"
#include "ttimer/timer/timer-loop.h"

namespace ttimer {
namespace {

absl::Status Run(absl::Duration duration, const TimerConfig& config) {
  auto logger = MakeLogger("main");
  SPDLOG_LOGGER_INFO(&logger, "timer for {} (interactive: {})", FormatRemaining(duration),
                     config.interactive);

  AnsiRenderer renderer(STDERR_FILENO);
  std::unique_ptr<RawMode> raw_mode;
  if (config.interactive) {
    if (isatty(STDIN_FILENO)) {
      raw_mode = absl::make_unique<RawMode>(STDIN_FILENO);
    } else {
      SPDLOG_LOGGER_WARN(&logger, "stdin is not a terminal: reading it without raw mode");
    }
  }

  EventLoopOptions options;
  options.input_fd = config.interactive ? STDIN_FILENO : -1;

  // An interrupt before the event loop watches for it would kill the process
  // with the terminal still in the alternate screen. Hold it pending instead.
  sigset_t saved_mask;
  absl::Status st = BlockSignals(options.interrupt_signals, &saved_mask);
  if (!st.ok()) {
    return SystemErrorWithInternal("Failed to set up signal handling",
                                   "Try notifying the developer", st.ToString());
  }
  absl::Cleanup restore_mask = [&logger, &saved_mask] {
    absl::Status mask_st = SetSignalMask(saved_mask);
    if (!mask_st.ok()) {
      SPDLOG_LOGGER_WARN(&logger, "{}", mask_st.ToString());
    }
  };

  TimerLoop timer(duration, &renderer);
  TerminalSession session(&renderer, raw_mode.get());

  st = session.Enter();
  if (st.ok()) {
    st = RunEventLoop(&timer, options);
  }

  // The terminal must be restored before anything is printed on the primary
  // screen, and on every path.
  absl::Status leave_st = session.Leave();
  if (!st.ok()) {
    if (!leave_st.ok()) {
      SPDLOG_LOGGER_ERROR(&logger, "also failed to restore terminal: {}",
                          leave_st.ToString());
    }
    return st;
  }
  if (!leave_st.ok()) {
    return leave_st;
  }

  SPDLOG_LOGGER_INFO(&logger, "timer done: {}", ToString(timer.countdown().state()));
  renderer.Print(timer.ExitMessage());
  st = renderer.Flush();
  if (!st.ok()) {
    return SystemErrorWithInternal("Failed to write to the terminal",
                                   "Try notifying the developer", st.ToString());
  }
  return absl::OkStatus();
}

}  // namespace
}  // namespace ttimer

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(absl::StrCat(
      "Countdown timer for the terminal.\n\nusage: ", argv[0], " [flags] ", ttimer::kUsage,
      "\n\nKeys: space or p to pause/resume, q, Esc or Ctrl+C to quit."));
  ttimer::MainInit(&argc, &argv);

  if (argc != 2) {
    std::cerr << ttimer::FormatHumanError(ttimer::UserError(
        "Invalid usage of the tool", absl::StrCat("Usage: ", argv[0], " ", ttimer::kUsage)));
    return 1;
  }

  absl::StatusOr<absl::Duration> duration_or = ttimer::ParseDuration(argv[1]);
  if (!duration_or.ok()) {
    std::cerr << ttimer::FormatHumanError(duration_or.status());
    return 2;
  }

  absl::Status s = ttimer::Run(*duration_or, ttimer::ConfigFromFlags());
  if (!s.ok()) {
    std::cerr << ttimer::FormatHumanError(s);
    return 3;
  }
  return 0;
}
