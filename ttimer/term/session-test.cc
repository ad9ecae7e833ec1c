#include "ttimer/term/session.h"

#include <unistd.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ttimer/errors/human-error.h"
#include "ttimer/timer/recording-renderer.h"

namespace ttimer {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(TerminalSessionTest, EnterAndLeave) {
  RecordingRenderer r;
  TerminalSession session(&r, nullptr);
  ASSERT_TRUE(session.Enter().ok());
  EXPECT_TRUE(session.entered());
  EXPECT_THAT(r.ops(),
              ElementsAre("EnterAlternateScreen", "HideCursor", "MoveTo(0,0)", "Flush"));
  r.ClearOps();

  ASSERT_TRUE(session.Leave().ok());
  EXPECT_FALSE(session.entered());
  EXPECT_THAT(r.ops(), ElementsAre("ShowCursor", "LeaveAlternateScreen", "Flush"));
  r.ClearOps();

  ASSERT_TRUE(session.Leave().ok());
  EXPECT_THAT(r.ops(), IsEmpty());
}

TEST(TerminalSessionTest, DestructorRestores) {
  RecordingRenderer r;
  {
    TerminalSession session(&r, nullptr);
    ASSERT_TRUE(session.Enter().ok());
    r.ClearOps();
  }
  EXPECT_THAT(r.ops(), ElementsAre("ShowCursor", "LeaveAlternateScreen", "Flush"));
}

TEST(TerminalSessionTest, EnterFailureStillRestores) {
  RecordingRenderer r;
  r.set_flush_status(absl::UnavailableError("no tty"));
  TerminalSession session(&r, nullptr);
  absl::Status st = session.Enter();
  EXPECT_TRUE(IsSystemError(st));
  EXPECT_EQ(st.message(), "Failed to enter alternate screen");
  EXPECT_EQ(ErrorHint(st), "Try notifying the developer");

  r.set_flush_status(absl::OkStatus());
  r.ClearOps();
  ASSERT_TRUE(session.Leave().ok());
  EXPECT_THAT(r.ops(), ElementsAre("ShowCursor", "LeaveAlternateScreen", "Flush"));
}

TEST(TerminalSessionTest, RawModeOnNonTerminalFails) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);

  RecordingRenderer r;
  RawMode raw(fds[0]);
  TerminalSession session(&r, &raw);
  absl::Status st = session.Enter();
  EXPECT_TRUE(IsSystemError(st));
  EXPECT_EQ(st.message(), "Failed to enable raw mode");
  EXPECT_FALSE(raw.enabled());
  EXPECT_THAT(r.ops(), IsEmpty());

  EXPECT_TRUE(session.Leave().ok());
  EXPECT_THAT(r.ops(), ElementsAre("ShowCursor", "LeaveAlternateScreen", "Flush"));

  close(fds[0]);
  close(fds[1]);
}

TEST(TerminalSessionTest, LeaveFailure) {
  RecordingRenderer r;
  TerminalSession session(&r, nullptr);
  ASSERT_TRUE(session.Enter().ok());
  r.set_flush_status(absl::UnavailableError("gone"));
  absl::Status st = session.Leave();
  EXPECT_TRUE(IsSystemError(st));
  EXPECT_EQ(st.message(), "Failed to clear the terminal");
  EXPECT_FALSE(session.entered());
}

}  // namespace
}  // namespace ttimer
