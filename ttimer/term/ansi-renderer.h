#ifndef TTIMER_TERM_ANSI_RENDERER_H_
#define TTIMER_TERM_ANSI_RENDERER_H_

#include <string>

#include "ttimer/timer/frame-renderer.h"

namespace ttimer {

// AnsiRenderer queues ANSI/xterm escape sequences and writes them to fd on
// Flush. It does not own fd.
class AnsiRenderer : public FrameRenderer {
 public:
  explicit AnsiRenderer(int fd) : fd_(fd) {}

  void EnterAlternateScreen() override;
  void LeaveAlternateScreen() override;
  void ShowCursor() override;
  void HideCursor() override;
  void MoveTo(uint16_t col, uint16_t row) override;
  void ClearLine() override;
  void ClearScreen() override;
  void BeginSynchronizedUpdate() override;
  void EndSynchronizedUpdate() override;
  void Print(absl::string_view text) override;

  absl::Status Flush() override;

  // Queued bytes not yet written.
  const std::string& pending() const { return buf_; }

 private:
  const int fd_;
  std::string buf_;
};

}  // namespace ttimer

#endif  // TTIMER_TERM_ANSI_RENDERER_H_
