#ifndef TTIMER_INIT_CONFIG_H_
#define TTIMER_INIT_CONFIG_H_

#include "absl/flags/declare.h"

ABSL_DECLARE_FLAG(bool, interactive);

namespace ttimer {

constexpr char kVersionString[] = "ttimer 0.1.2";
constexpr char kUsage[] = "<duration in format [[[d:]h:]m:]s[.ms]>";

struct TimerConfig {
  // Enables raw mode and keyboard handling. When false only ticks and
  // interrupt signals drive the timer.
  bool interactive = true;
};

TimerConfig ConfigFromFlags();

}  // namespace ttimer

#endif  // TTIMER_INIT_CONFIG_H_
