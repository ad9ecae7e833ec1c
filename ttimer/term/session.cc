#include "ttimer/term/session.h"

#include "ttimer/errors/human-error.h"
#include "ttimer/log/spdlog.h"

namespace ttimer {

namespace {

constexpr char kDeveloperHint[] = "Try notifying the developer";

}  // namespace

TerminalSession::TerminalSession(FrameRenderer* renderer, RawMode* raw_mode)
    : renderer_(renderer), raw_mode_(raw_mode), logger_(MakeLogger("term-session")) {}

TerminalSession::~TerminalSession() {
  if (entered_) {
    absl::Status st = Leave();
    if (!st.ok()) {
      SPDLOG_LOGGER_ERROR(&logger_, "failed to restore terminal: {}", st.ToString());
    }
  }
}

absl::Status TerminalSession::Enter() {
  // Mark as entered first so that a partial setup is still undone.
  entered_ = true;
  if (raw_mode_ != nullptr) {
    absl::Status st = raw_mode_->Enable();
    if (!st.ok()) {
      return SystemErrorWithInternal("Failed to enable raw mode", kDeveloperHint,
                                     st.ToString());
    }
  }
  renderer_->EnterAlternateScreen();
  renderer_->HideCursor();
  renderer_->MoveTo(0, 0);
  absl::Status st = renderer_->Flush();
  if (!st.ok()) {
    return SystemErrorWithInternal("Failed to enter alternate screen", kDeveloperHint,
                                   st.ToString());
  }
  SPDLOG_LOGGER_INFO(&logger_, "entered alternate screen (raw mode: {})",
                     raw_mode_ != nullptr);
  return absl::OkStatus();
}

absl::Status TerminalSession::Leave() {
  if (!entered_) {
    return absl::OkStatus();
  }
  entered_ = false;

  // Raw mode goes first so that later output gets normal newline handling.
  absl::Status st;
  if (raw_mode_ != nullptr) {
    st.Update(raw_mode_->Disable());
  }
  renderer_->ShowCursor();
  renderer_->LeaveAlternateScreen();
  st.Update(renderer_->Flush());
  if (!st.ok()) {
    return SystemErrorWithInternal("Failed to clear the terminal", kDeveloperHint,
                                   st.ToString());
  }
  SPDLOG_LOGGER_INFO(&logger_, "left alternate screen");
  return absl::OkStatus();
}

}  // namespace ttimer
