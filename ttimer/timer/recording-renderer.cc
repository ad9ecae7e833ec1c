#include "ttimer/timer/recording-renderer.h"

#include "absl/strings/str_cat.h"

namespace ttimer {

void RecordingRenderer::EnterAlternateScreen() { ops_.push_back("EnterAlternateScreen"); }
void RecordingRenderer::LeaveAlternateScreen() { ops_.push_back("LeaveAlternateScreen"); }
void RecordingRenderer::ShowCursor() { ops_.push_back("ShowCursor"); }
void RecordingRenderer::HideCursor() { ops_.push_back("HideCursor"); }

void RecordingRenderer::MoveTo(uint16_t col, uint16_t row) {
  ops_.push_back(absl::StrCat("MoveTo(", col, ",", row, ")"));
}

void RecordingRenderer::ClearLine() { ops_.push_back("ClearLine"); }
void RecordingRenderer::ClearScreen() { ops_.push_back("ClearScreen"); }
void RecordingRenderer::BeginSynchronizedUpdate() { ops_.push_back("BeginSync"); }
void RecordingRenderer::EndSynchronizedUpdate() { ops_.push_back("EndSync"); }

void RecordingRenderer::Print(absl::string_view text) {
  ops_.push_back(absl::StrCat("Print(", text, ")"));
}

absl::Status RecordingRenderer::Flush() {
  ops_.push_back("Flush");
  ++num_flushes_;
  return flush_status_;
}

}  // namespace ttimer
