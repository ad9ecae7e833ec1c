#ifndef TTIMER_TIMER_COUNTDOWN_H_
#define TTIMER_TIMER_COUNTDOWN_H_

#include "absl/time/time.h"

namespace ttimer {

enum class TimerState {
  kRunning,
  kPaused,
  kFinished,
  kStoppedByUser,
};

const char* ToString(TimerState state);

// Countdown is the state of one timer session. It does no I/O.
//
// remaining only moves while running, by exactly one tick unit per tick, and
// never goes below zero. Once finished or stopped, further events are ignored.
class Countdown {
 public:
  explicit Countdown(absl::Duration initial, absl::Duration tick_unit = absl::Seconds(1));

  TimerState state() const { return state_; }
  bool paused() const { return state_ == TimerState::kPaused; }
  bool done() const {
    return state_ == TimerState::kFinished || state_ == TimerState::kStoppedByUser;
  }

  absl::Duration initial() const { return initial_; }
  absl::Duration remaining() const { return remaining_; }
  absl::Duration elapsed() const { return initial_ - remaining_; }

  bool paused_message_shown() const { return paused_message_shown_; }
  void set_paused_message_shown(bool shown) { paused_message_shown_ = shown; }

  // Advances one tick. Returns true if remaining changed.
  bool Tick();

  // Switches between running and paused. Returns false if already done.
  bool TogglePause();

  void StopByUser();
  void Finish();

 private:
  const absl::Duration initial_;
  const absl::Duration tick_unit_;
  absl::Duration remaining_;
  TimerState state_;
  bool paused_message_shown_ = false;
};

}  // namespace ttimer

#endif  // TTIMER_TIMER_COUNTDOWN_H_
