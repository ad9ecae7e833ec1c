#include "ttimer/term/input.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace ttimer {

std::string ToString(const InputEvent& event) {
  switch (event.kind) {
    case InputKind::kClosed:
      return "closed";
    case InputKind::kOther:
      return "other";
    case InputKind::kKey:
      break;
  }
  std::string out;
  if (event.modifiers & kCtrl) {
    absl::StrAppend(&out, "ctrl+");
  }
  if (event.modifiers & kAlt) {
    absl::StrAppend(&out, "alt+");
  }
  switch (event.code) {
    case kKeyTab:
      absl::StrAppend(&out, "tab");
      break;
    case kKeyEnter:
      absl::StrAppend(&out, "enter");
      break;
    case kKeyEsc:
      absl::StrAppend(&out, "esc");
      break;
    case kKeyBackspace:
      absl::StrAppend(&out, "backspace");
      break;
    case ' ':
      absl::StrAppend(&out, "space");
      break;
    default:
      if (event.code > ' ' && event.code < 127) {
        out.push_back(static_cast<char>(event.code));
      } else {
        absl::StrAppend(&out, absl::StrFormat("0x%02x", event.code));
      }
  }
  return out;
}

namespace {

constexpr unsigned char kEsc = 0x1b;

// Returns the number of bytes in the escape sequence starting at bytes[0]
// (which is ESC followed by '[' or 'O').
size_t EscapeSequenceLength(absl::string_view bytes) {
  if (bytes[1] == 'O') {
    // SS3: ESC O <final>
    return std::min<size_t>(3, bytes.size());
  }
  // CSI: ESC [ <params/intermediates 0x20-0x3f>* <final 0x40-0x7e>
  size_t i = 2;
  while (i < bytes.size()) {
    unsigned char c = bytes[i++];
    if (c >= 0x40 && c <= 0x7e) {
      break;
    }
  }
  return i;
}

}  // namespace

std::vector<InputEvent> DecodeInput(absl::string_view bytes) {
  std::vector<InputEvent> events;
  if (DecodeInputPrefix(bytes, &events) < bytes.size()) {
    events.push_back(InputEvent::Key(kKeyEsc));
  }
  return events;
}

size_t DecodeInputPrefix(absl::string_view bytes, std::vector<InputEvent>* events) {
  size_t i = 0;
  while (i < bytes.size()) {
    unsigned char c = bytes[i];
    if (c == kEsc) {
      if (i + 1 == bytes.size()) {
        return i;
      }
      unsigned char next = bytes[i + 1];
      if (next == '[' || next == 'O') {
        events->push_back(InputEvent::Other());
        i += EscapeSequenceLength(bytes.substr(i));
        continue;
      }
      if (next == kEsc) {
        events->push_back(InputEvent::Key(kKeyEsc));
        i++;
        continue;
      }
      std::vector<InputEvent> rest = DecodeInput(bytes.substr(i + 1, 1));
      for (InputEvent e : rest) {
        if (e.kind == InputKind::kKey) {
          e.modifiers |= kAlt;
        }
        events->push_back(e);
      }
      i += 2;
      continue;
    }

    if (c == '\r' || c == '\n') {
      events->push_back(InputEvent::Key(kKeyEnter));
    } else if (c == '\t') {
      events->push_back(InputEvent::Key(kKeyTab));
    } else if (c == 0x7f || c == 0x08) {
      events->push_back(InputEvent::Key(kKeyBackspace));
    } else if (c == 0) {
      events->push_back(InputEvent::Key(' ', kCtrl));
    } else if (c < 0x20) {
      events->push_back(InputEvent::Key('a' + c - 1, kCtrl));
    } else if (c < 0x80) {
      events->push_back(InputEvent::Key(c));
    } else if ((c & 0xc0) == 0xc0) {
      // Lead byte of a multi-byte UTF-8 character. Continuation bytes
      // (10xxxxxx) are skipped below.
      events->push_back(InputEvent::Other());
    }
    i++;
  }
  return i;
}

}  // namespace ttimer
