#include "ttimer/term/ansi-renderer.h"

#include <errno.h>
#include <unistd.h>

#include "absl/strings/str_cat.h"
#include "ttimer/posix/strerror.h"

namespace ttimer {

#define CSI "\x1b["

void AnsiRenderer::EnterAlternateScreen() { buf_.append(CSI "?1049h"); }
void AnsiRenderer::LeaveAlternateScreen() { buf_.append(CSI "?1049l"); }
void AnsiRenderer::ShowCursor() { buf_.append(CSI "?25h"); }
void AnsiRenderer::HideCursor() { buf_.append(CSI "?25l"); }

void AnsiRenderer::MoveTo(uint16_t col, uint16_t row) {
  // Escape sequences are 1-based.
  absl::StrAppend(&buf_, CSI, row + 1, ";", col + 1, "H");
}

void AnsiRenderer::ClearLine() { buf_.append(CSI "2K"); }
void AnsiRenderer::ClearScreen() { buf_.append(CSI "2J"); }
void AnsiRenderer::BeginSynchronizedUpdate() { buf_.append(CSI "?2026h"); }
void AnsiRenderer::EndSynchronizedUpdate() { buf_.append(CSI "?2026l"); }

void AnsiRenderer::Print(absl::string_view text) { buf_.append(text.data(), text.size()); }

#undef CSI

absl::Status AnsiRenderer::Flush() {
  size_t written = 0;
  while (written != buf_.size()) {
    ssize_t wrote = write(fd_, buf_.data() + written, buf_.size() - written);
    if (wrote == -1) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      buf_.clear();
      return absl::InternalError(absl::StrCat("failed to write to fd ", fd_, ": ",
                                              StrError(err)));
    }
    written += wrote;
  }
  buf_.clear();
  return absl::OkStatus();
}

}  // namespace ttimer
