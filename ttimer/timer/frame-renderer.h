#ifndef TTIMER_TIMER_FRAME_RENDERER_H_
#define TTIMER_TIMER_FRAME_RENDERER_H_

#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace ttimer {

// FrameRenderer is the terminal surface the timer draws on.
//
// Drawing operations are queued and only reach the terminal on Flush, so a
// frame built between BeginSynchronizedUpdate and EndSynchronizedUpdate is
// written in one piece.
class FrameRenderer {
 public:
  virtual ~FrameRenderer() = default;

  virtual void EnterAlternateScreen() = 0;
  virtual void LeaveAlternateScreen() = 0;
  virtual void ShowCursor() = 0;
  virtual void HideCursor() = 0;
  virtual void MoveTo(uint16_t col, uint16_t row) = 0;
  virtual void ClearLine() = 0;
  virtual void ClearScreen() = 0;
  virtual void BeginSynchronizedUpdate() = 0;
  virtual void EndSynchronizedUpdate() = 0;
  virtual void Print(absl::string_view text) = 0;

  virtual absl::Status Flush() = 0;
};

}  // namespace ttimer

#endif  // TTIMER_TIMER_FRAME_RENDERER_H_
