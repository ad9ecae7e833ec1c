#include "ttimer/term/raw-mode.h"

#include <errno.h>

#include "absl/strings/str_cat.h"
#include "ttimer/posix/strerror.h"

namespace ttimer {

RawMode::~RawMode() {
  if (enabled_) {
    tcsetattr(fd_, TCSAFLUSH, &saved_);
  }
}

absl::Status RawMode::Enable() {
  if (enabled_) {
    return absl::OkStatus();
  }
  if (tcgetattr(fd_, &saved_) == -1) {
    return absl::InternalError(absl::StrCat("tcgetattr: ", StrError(errno)));
  }
  struct termios raw = saved_;
  cfmakeraw(&raw);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(fd_, TCSAFLUSH, &raw) == -1) {
    return absl::InternalError(absl::StrCat("tcsetattr: ", StrError(errno)));
  }
  enabled_ = true;
  return absl::OkStatus();
}

absl::Status RawMode::Disable() {
  if (!enabled_) {
    return absl::OkStatus();
  }
  enabled_ = false;
  if (tcsetattr(fd_, TCSAFLUSH, &saved_) == -1) {
    return absl::InternalError(absl::StrCat("tcsetattr: ", StrError(errno)));
  }
  return absl::OkStatus();
}

}  // namespace ttimer
