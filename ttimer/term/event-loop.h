#ifndef TTIMER_TERM_EVENT_LOOP_H_
#define TTIMER_TERM_EVENT_LOOP_H_

#include <csignal>
#include <deque>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "ttimer/term/input.h"
#include "ttimer/timer/timer-loop.h"

namespace ttimer {

struct EventLoopOptions {
  // Keys are read from here. -1 disables input.
  int input_fd = 0;
  absl::Duration tick_period = absl::Seconds(1);
  // How long a trailing ESC waits for the rest of an escape sequence before
  // it is taken as the Esc key.
  absl::Duration escape_timeout = absl::Milliseconds(200);
  // Callers may block these before RunEventLoop so that none are lost while the
  // loop starts up; they are unblocked once the loop watches for them.
  std::vector<int> interrupt_signals = {SIGINT, SIGTERM};
};

struct LoopEvent {
  enum Kind {
    kTick,
    kInput,
    kInterrupt,
    kError,
  };

  Kind kind = kTick;
  InputEvent input;
  absl::Status error;

  static LoopEvent Tick() { return LoopEvent{kTick, {}, {}}; }
  static LoopEvent Input(InputEvent e) { return LoopEvent{kInput, e, {}}; }
  static LoopEvent Interrupt() { return LoopEvent{kInterrupt, {}, {}}; }
  static LoopEvent Error(absl::Status st) { return LoopEvent{kError, {}, std::move(st)}; }
};

// PopNextEvent removes the event to handle next. Input, interrupt and error
// events go before ticks; within each group the oldest goes first.
// pending must not be empty.
LoopEvent PopNextEvent(std::deque<LoopEvent>* pending);

// RunEventLoop draws the first frame and then feeds timer one event per
// iteration until it is done or an error occurs.
//
// Ticks, input bytes and signals are multiplexed on a single-threaded
// boost::asio::io_context. Each iteration waits only if nothing is pending,
// collects every event that is ready and handles exactly one of them (see
// PopNextEvent); the rest roll over to the next iteration.
absl::Status RunEventLoop(TimerLoop* timer, const EventLoopOptions& options);

}  // namespace ttimer

#endif  // TTIMER_TERM_EVENT_LOOP_H_
