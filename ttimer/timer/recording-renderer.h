#ifndef TTIMER_TIMER_RECORDING_RENDERER_H_
#define TTIMER_TIMER_RECORDING_RENDERER_H_

#include <string>
#include <utility>
#include <vector>

#include "ttimer/timer/frame-renderer.h"

namespace ttimer {

// RecordingRenderer keeps a readable log of every operation for tests.
// Flush appends "Flush" and returns the configured status.
class RecordingRenderer : public FrameRenderer {
 public:
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

  const std::vector<std::string>& ops() const { return ops_; }
  void ClearOps() { ops_.clear(); }

  void set_flush_status(absl::Status st) { flush_status_ = std::move(st); }
  int num_flushes() const { return num_flushes_; }

 private:
  std::vector<std::string> ops_;
  absl::Status flush_status_;
  int num_flushes_ = 0;
};

}  // namespace ttimer

#endif  // TTIMER_TIMER_RECORDING_RENDERER_H_
