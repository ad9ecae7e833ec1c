#ifndef TTIMER_TIMER_TIMER_LOOP_H_
#define TTIMER_TIMER_TIMER_LOOP_H_

#include <string>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "spdlog/spdlog.h"
#include "ttimer/term/input.h"
#include "ttimer/timer/countdown.h"
#include "ttimer/timer/frame-renderer.h"

namespace ttimer {

enum class KeyAction {
  kIgnore,
  kQuit,         // q, Q, Esc
  kInterrupt,    // Ctrl+C
  kTogglePause,  // space, p, P
};

KeyAction ActionForKey(const InputEvent& event);

// TimerLoop reacts to one event at a time and draws the result.
//
// It owns the countdown state but not the terminal session: entering and
// leaving the alternate screen is the caller's job. Any error returned is a
// system error and the caller is expected to stop feeding events.
class TimerLoop {
 public:
  TimerLoop(absl::Duration initial, FrameRenderer* renderer,
            absl::Duration tick_unit = absl::Seconds(1));

  // Draws the first frame.
  absl::Status Start();

  absl::Status OnTick();
  absl::Status OnInput(const InputEvent& event);
  absl::Status OnInterrupt();

  bool done() const { return countdown_.done(); }
  const Countdown& countdown() const { return countdown_; }

  // Message for the primary screen once the loop is done.
  std::string ExitMessage() const;

 private:
  absl::Status DrawRemaining();
  absl::Status ShowPausedBanner();
  absl::Status ClearPausedBanner();
  absl::Status FlushFrame();

  Countdown countdown_;
  FrameRenderer* renderer_;
  spdlog::logger logger_;
};

}  // namespace ttimer

#endif  // TTIMER_TIMER_TIMER_LOOP_H_
