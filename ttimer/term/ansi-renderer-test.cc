#include "ttimer/term/ansi-renderer.h"

#include <fcntl.h>
#include <unistd.h>

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ttimer {
namespace {

std::string ReadAll(int fd) {
  std::string out;
  char buf[256];
  ssize_t n;
  while ((n = read(fd, buf, sizeof(buf))) > 0) {
    out.append(buf, n);
  }
  return out;
}

TEST(AnsiRendererTest, QueuesUntilFlush) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);

  AnsiRenderer r(fds[1]);
  r.BeginSynchronizedUpdate();
  r.ClearScreen();
  r.MoveTo(0, 0);
  r.Print("Remaining time: 5s");
  r.EndSynchronizedUpdate();
  EXPECT_EQ(r.pending(),
            "\x1b[?2026h\x1b[2J\x1b[1;1HRemaining time: 5s\x1b[?2026l");

  ASSERT_TRUE(r.Flush().ok());
  EXPECT_EQ(r.pending(), "");
  close(fds[1]);

  EXPECT_EQ(ReadAll(fds[0]), "\x1b[?2026h\x1b[2J\x1b[1;1HRemaining time: 5s\x1b[?2026l");
  close(fds[0]);
}

TEST(AnsiRendererTest, ScreenAndCursorSequences) {
  AnsiRenderer r(-1);
  r.EnterAlternateScreen();
  r.HideCursor();
  r.MoveTo(4, 2);
  r.ClearLine();
  r.ShowCursor();
  r.LeaveAlternateScreen();
  EXPECT_EQ(r.pending(), "\x1b[?1049h\x1b[?25l\x1b[3;5H\x1b[2K\x1b[?25h\x1b[?1049l");
}

TEST(AnsiRendererTest, EmptyFlushWritesNothing) {
  AnsiRenderer r(-1);
  EXPECT_TRUE(r.Flush().ok());
}

TEST(AnsiRendererTest, WriteErrorIsReported) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  close(fds[1]);

  AnsiRenderer r(fds[1]);
  r.Print("x");
  absl::Status st = r.Flush();
  EXPECT_FALSE(st.ok());
  EXPECT_THAT(std::string(st.message()), testing::HasSubstr("failed to write"));
  EXPECT_EQ(r.pending(), "");
  close(fds[0]);
}

}  // namespace
}  // namespace ttimer
