#include "ttimer/timer/countdown.h"

#include <algorithm>

#include "ttimer/log/spdlog.h"

namespace ttimer {

const char* ToString(TimerState state) {
  switch (state) {
    case TimerState::kRunning:
      return "running";
    case TimerState::kPaused:
      return "paused";
    case TimerState::kFinished:
      return "finished";
    case TimerState::kStoppedByUser:
      return "stopped-by-user";
  }
  return "unknown";
}

Countdown::Countdown(absl::Duration initial, absl::Duration tick_unit)
    : initial_(initial),
      tick_unit_(tick_unit),
      remaining_(initial),
      state_(initial > absl::ZeroDuration() ? TimerState::kRunning
                                            : TimerState::kFinished) {
  TT_ASSERT_MESG(initial >= absl::ZeroDuration(), "countdown cannot start negative");
  TT_ASSERT_MESG(tick_unit > absl::ZeroDuration(), "tick unit must be positive");
}

bool Countdown::Tick() {
  if (state_ != TimerState::kRunning) {
    return false;
  }
  remaining_ = std::max(remaining_ - tick_unit_, absl::ZeroDuration());
  if (remaining_ == absl::ZeroDuration()) {
    state_ = TimerState::kFinished;
  }
  return true;
}

bool Countdown::TogglePause() {
  switch (state_) {
    case TimerState::kRunning:
      state_ = TimerState::kPaused;
      return true;
    case TimerState::kPaused:
      state_ = TimerState::kRunning;
      return true;
    default:
      return false;
  }
}

void Countdown::StopByUser() {
  if (!done()) {
    state_ = TimerState::kStoppedByUser;
  }
}

void Countdown::Finish() {
  if (!done()) {
    state_ = TimerState::kFinished;
  }
}

}  // namespace ttimer
