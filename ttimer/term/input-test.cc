#include "ttimer/term/input.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ttimer {

void PrintTo(const InputEvent& e, std::ostream* os) { *os << ToString(e); }

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(DecodeInputTest, PrintableKeys) {
  EXPECT_THAT(DecodeInput("q p"), ElementsAre(InputEvent::Key('q'), InputEvent::Key(' '),
                                              InputEvent::Key('p')));
  EXPECT_THAT(DecodeInput(""), IsEmpty());
}

TEST(DecodeInputTest, ControlBytes) {
  EXPECT_THAT(DecodeInput("\x03"), ElementsAre(InputEvent::Key('c', kCtrl)));
  EXPECT_THAT(DecodeInput("\x04"), ElementsAre(InputEvent::Key('d', kCtrl)));
  EXPECT_THAT(DecodeInput("\r\n\t\x7f"),
              ElementsAre(InputEvent::Key(kKeyEnter), InputEvent::Key(kKeyEnter),
                          InputEvent::Key(kKeyTab), InputEvent::Key(kKeyBackspace)));
}

TEST(DecodeInputTest, EscapeSequencesAreOther) {
  // Up arrow, then F1 (SS3), then Delete.
  EXPECT_THAT(DecodeInput("\x1b[A\x1bOP\x1b[3~q"),
              ElementsAre(InputEvent::Other(), InputEvent::Other(), InputEvent::Other(),
                          InputEvent::Key('q')));
}

TEST(DecodeInputTest, LoneEscIsEscKey) {
  EXPECT_THAT(DecodeInput("\x1b"), ElementsAre(InputEvent::Key(kKeyEsc)));
  EXPECT_THAT(DecodeInput("\x1b\x1b"),
              ElementsAre(InputEvent::Key(kKeyEsc), InputEvent::Key(kKeyEsc)));
}

TEST(DecodeInputTest, EscPrefixIsAlt) {
  EXPECT_THAT(DecodeInput("\x1bq"), ElementsAre(InputEvent::Key('q', kAlt)));
}

TEST(DecodeInputPrefixTest, HoldsBackTrailingEsc) {
  std::vector<InputEvent> events;
  EXPECT_EQ(DecodeInputPrefix("q\x1b", &events), 1u);
  EXPECT_THAT(events, ElementsAre(InputEvent::Key('q')));

  events.clear();
  EXPECT_EQ(DecodeInputPrefix("\x1b", &events), 0u);
  EXPECT_THAT(events, IsEmpty());

  // The held ESC joins the next chunk into one arrow key.
  EXPECT_EQ(DecodeInputPrefix("\x1b[A", &events), 3u);
  EXPECT_THAT(events, ElementsAre(InputEvent::Other()));
}

TEST(DecodeInputPrefixTest, EscPairIsNotHeld) {
  std::vector<InputEvent> events;
  EXPECT_EQ(DecodeInputPrefix("\x1b\x1b", &events), 1u);
  EXPECT_THAT(events, ElementsAre(InputEvent::Key(kKeyEsc)));

  events.clear();
  EXPECT_EQ(DecodeInputPrefix("\x1b[1;5A", &events), 6u);
  EXPECT_THAT(events, ElementsAre(InputEvent::Other()));
}

TEST(DecodeInputTest, NonAsciiIsOther) {
  // "é" then "x"
  EXPECT_THAT(DecodeInput("\xc3\xa9x"), ElementsAre(InputEvent::Other(), InputEvent::Key('x')));
}

TEST(InputEventTest, ToString) {
  EXPECT_EQ(ToString(InputEvent::Key('c', kCtrl)), "ctrl+c");
  EXPECT_EQ(ToString(InputEvent::Key(' ')), "space");
  EXPECT_EQ(ToString(InputEvent::Key(kKeyEsc)), "esc");
  EXPECT_EQ(ToString(InputEvent::Closed()), "closed");
  EXPECT_EQ(ToString(InputEvent::Other()), "other");
}

}  // namespace
}  // namespace ttimer
