#ifndef TTIMER_TERM_RAW_MODE_H_
#define TTIMER_TERM_RAW_MODE_H_

#include <termios.h>

#include "absl/status/status.h"

namespace ttimer {

// RawMode switches a terminal fd to raw input (no line buffering, echo or
// signal keys) and back. The destructor restores the saved mode if Disable was
// not called.
class RawMode {
 public:
  explicit RawMode(int fd) : fd_(fd) {}
  ~RawMode();

  RawMode(const RawMode&) = delete;
  RawMode& operator=(const RawMode&) = delete;

  absl::Status Enable();
  absl::Status Disable();

  bool enabled() const { return enabled_; }

 private:
  const int fd_;
  bool enabled_ = false;
  struct termios saved_;
};

}  // namespace ttimer

#endif  // TTIMER_TERM_RAW_MODE_H_
