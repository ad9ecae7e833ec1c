#include "ttimer/timer/timer-loop.h"

#include "absl/strings/str_cat.h"
#include "ttimer/duration/format.h"
#include "ttimer/errors/human-error.h"
#include "ttimer/log/spdlog.h"

namespace ttimer {
namespace {

constexpr uint16_t kRemainingRow = 0;
constexpr uint16_t kPausedStatusRow = 1;
constexpr uint16_t kPausedHelpRow = 2;

constexpr char kPausedStatus[] = "PAUSED";
constexpr char kPausedHelp[] = "Press space or p to resume, q to quit";

}  // namespace

KeyAction ActionForKey(const InputEvent& event) {
  if (event.kind != InputKind::kKey) {
    return KeyAction::kIgnore;
  }
  if (event.modifiers == kCtrl && event.code == 'c') {
    return KeyAction::kInterrupt;
  }
  if (event.modifiers != kNoModifier) {
    return KeyAction::kIgnore;
  }
  switch (event.code) {
    case 'q':
    case 'Q':
    case kKeyEsc:
      return KeyAction::kQuit;
    case ' ':
    case 'p':
    case 'P':
      return KeyAction::kTogglePause;
    default:
      return KeyAction::kIgnore;
  }
}

TimerLoop::TimerLoop(absl::Duration initial, FrameRenderer* renderer,
                     absl::Duration tick_unit)
    : countdown_(initial, tick_unit),
      renderer_(renderer),
      logger_(MakeLogger("timer-loop")) {}

absl::Status TimerLoop::Start() {
  SPDLOG_LOGGER_INFO(&logger_, "start countdown from {}",
                     absl::FormatDuration(countdown_.initial()));
  if (countdown_.done()) {
    return absl::OkStatus();
  }
  return DrawRemaining();
}

absl::Status TimerLoop::OnTick() {
  switch (countdown_.state()) {
    case TimerState::kRunning:
      countdown_.Tick();
      TT_SPDLOG_CHECK_MESG(&logger_, countdown_.remaining() >= absl::ZeroDuration(),
                           "remaining time went negative");
      if (countdown_.done()) {
        SPDLOG_LOGGER_INFO(&logger_, "countdown reached zero");
        return absl::OkStatus();
      }
      return DrawRemaining();
    case TimerState::kPaused:
      if (!countdown_.paused_message_shown()) {
        return ShowPausedBanner();
      }
      return absl::OkStatus();
    default:
      return absl::OkStatus();
  }
}

absl::Status TimerLoop::OnInput(const InputEvent& event) {
  if (countdown_.done()) {
    return absl::OkStatus();
  }
  if (event.kind == InputKind::kClosed) {
    SPDLOG_LOGGER_INFO(&logger_, "input stream closed");
    countdown_.Finish();
    return absl::OkStatus();
  }

  switch (ActionForKey(event)) {
    case KeyAction::kQuit:
    case KeyAction::kInterrupt:
      SPDLOG_LOGGER_INFO(&logger_, "stopped by {} with {} remaining", ToString(event),
                         absl::FormatDuration(countdown_.remaining()));
      countdown_.StopByUser();
      return absl::OkStatus();
    case KeyAction::kTogglePause:
      countdown_.TogglePause();
      SPDLOG_LOGGER_INFO(&logger_, "now {} with {} remaining",
                         ToString(countdown_.state()),
                         absl::FormatDuration(countdown_.remaining()));
      if (countdown_.paused()) {
        return ShowPausedBanner();
      }
      return ClearPausedBanner();
    case KeyAction::kIgnore:
      SPDLOG_LOGGER_DEBUG(&logger_, "ignore input: {}", ToString(event));
      return absl::OkStatus();
  }
  return absl::OkStatus();
}

absl::Status TimerLoop::OnInterrupt() {
  if (!countdown_.done()) {
    SPDLOG_LOGGER_INFO(&logger_, "interrupted with {} remaining",
                       absl::FormatDuration(countdown_.remaining()));
    countdown_.StopByUser();
  }
  return absl::OkStatus();
}

std::string TimerLoop::ExitMessage() const {
  switch (countdown_.state()) {
    case TimerState::kFinished:
      return "Timer finished!\n";
    case TimerState::kStoppedByUser:
      return absl::StrCat("Timer stopped by user at ",
                          FormatRemaining(countdown_.remaining()), " (elapsed ",
                          FormatRemaining(countdown_.elapsed()), ").\n");
    default:
      return "";
  }
}

absl::Status TimerLoop::DrawRemaining() {
  renderer_->BeginSynchronizedUpdate();
  renderer_->ClearScreen();
  renderer_->MoveTo(0, kRemainingRow);
  renderer_->Print(
      absl::StrCat("Remaining time: ", FormatRemaining(countdown_.remaining())));
  renderer_->EndSynchronizedUpdate();
  return FlushFrame();
}

absl::Status TimerLoop::ShowPausedBanner() {
  renderer_->BeginSynchronizedUpdate();
  renderer_->MoveTo(0, kPausedStatusRow);
  renderer_->ClearLine();
  renderer_->Print(kPausedStatus);
  renderer_->MoveTo(0, kPausedHelpRow);
  renderer_->ClearLine();
  renderer_->Print(kPausedHelp);
  renderer_->EndSynchronizedUpdate();
  absl::Status st = FlushFrame();
  if (st.ok()) {
    countdown_.set_paused_message_shown(true);
  }
  return st;
}

absl::Status TimerLoop::ClearPausedBanner() {
  if (!countdown_.paused_message_shown()) {
    return absl::OkStatus();
  }
  renderer_->BeginSynchronizedUpdate();
  renderer_->MoveTo(0, kPausedStatusRow);
  renderer_->ClearLine();
  renderer_->MoveTo(0, kPausedHelpRow);
  renderer_->ClearLine();
  renderer_->EndSynchronizedUpdate();
  absl::Status st = FlushFrame();
  if (st.ok()) {
    countdown_.set_paused_message_shown(false);
  }
  return st;
}

absl::Status TimerLoop::FlushFrame() {
  absl::Status st = renderer_->Flush();
  if (!st.ok()) {
    SPDLOG_LOGGER_ERROR(&logger_, "failed to write frame: {}", st.ToString());
    return SystemErrorWithInternal("Failed to write to the terminal",
                                   "Try notifying the developer", st.ToString());
  }
  return absl::OkStatus();
}

}  // namespace ttimer
