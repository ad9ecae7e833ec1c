#ifndef TTIMER_TERM_SESSION_H_
#define TTIMER_TERM_SESSION_H_

#include "absl/status/status.h"
#include "spdlog/spdlog.h"
#include "ttimer/term/raw-mode.h"
#include "ttimer/timer/frame-renderer.h"

namespace ttimer {

// TerminalSession acquires the terminal for the timer (raw input, alternate
// screen, hidden cursor) and gives it back.
//
// Leave runs every restore step even if an earlier one fails, and the
// destructor calls it if the owner did not.
class TerminalSession {
 public:
  // raw_mode may be null when input is not a terminal.
  TerminalSession(FrameRenderer* renderer, RawMode* raw_mode);
  ~TerminalSession();

  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  absl::Status Enter();
  absl::Status Leave();

  bool entered() const { return entered_; }

 private:
  FrameRenderer* renderer_;
  RawMode* raw_mode_;
  bool entered_ = false;
  spdlog::logger logger_;
};

}  // namespace ttimer

#endif  // TTIMER_TERM_SESSION_H_
