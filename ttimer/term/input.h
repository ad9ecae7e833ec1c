#ifndef TTIMER_TERM_INPUT_H_
#define TTIMER_TERM_INPUT_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace ttimer {

enum class InputKind {
  kKey,
  kOther,   // anything we don't decode (escape sequences, non-ASCII)
  kClosed,  // end of the input stream
};

enum KeyModifier : uint8_t {
  kNoModifier = 0,
  kCtrl = 1 << 0,
  kAlt = 1 << 1,
};

// Codes for keys without a printable character. Printable keys use their
// ASCII value.
constexpr int kKeyTab = 9;
constexpr int kKeyEnter = 13;
constexpr int kKeyEsc = 27;
constexpr int kKeyBackspace = 127;

struct InputEvent {
  InputKind kind = InputKind::kOther;
  int code = 0;
  uint8_t modifiers = kNoModifier;

  static InputEvent Key(int code, uint8_t modifiers = kNoModifier) {
    return InputEvent{InputKind::kKey, code, modifiers};
  }
  static InputEvent Other() { return InputEvent{InputKind::kOther, 0, kNoModifier}; }
  static InputEvent Closed() { return InputEvent{InputKind::kClosed, 0, kNoModifier}; }

  bool operator==(const InputEvent& other) const {
    return kind == other.kind && code == other.code && modifiers == other.modifiers;
  }
};

std::string ToString(const InputEvent& event);

// DecodeInput turns bytes read from a raw-mode terminal into events.
//
// Control bytes become Ctrl+letter keys (0x03 is Ctrl+C), ESC followed by a
// CSI or SS3 sequence becomes a single kOther event, ESC followed by another
// byte is Alt+byte and a trailing lone ESC is the Esc key.
std::vector<InputEvent> DecodeInput(absl::string_view bytes);

// DecodeInputPrefix is DecodeInput for input that arrives in chunks. A lone
// ESC at the end of bytes is left undecoded because the rest of its escape
// sequence may still be in flight. Returns the number of bytes consumed.
size_t DecodeInputPrefix(absl::string_view bytes, std::vector<InputEvent>* events);

}  // namespace ttimer

#endif  // TTIMER_TERM_INPUT_H_
