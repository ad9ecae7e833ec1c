#include "ttimer/timer/countdown.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ttimer {
namespace {

TEST(CountdownTest, CountsDownToFinished) {
  Countdown c(absl::Seconds(3));
  EXPECT_EQ(c.state(), TimerState::kRunning);
  EXPECT_EQ(c.initial(), absl::Seconds(3));

  EXPECT_TRUE(c.Tick());
  EXPECT_EQ(c.remaining(), absl::Seconds(2));
  EXPECT_TRUE(c.Tick());
  EXPECT_EQ(c.remaining(), absl::Seconds(1));
  EXPECT_EQ(c.state(), TimerState::kRunning);
  EXPECT_TRUE(c.Tick());
  EXPECT_EQ(c.remaining(), absl::ZeroDuration());
  EXPECT_EQ(c.state(), TimerState::kFinished);
  EXPECT_TRUE(c.done());

  EXPECT_FALSE(c.Tick());
  EXPECT_EQ(c.remaining(), absl::ZeroDuration());
  EXPECT_EQ(c.elapsed(), absl::Seconds(3));
}

TEST(CountdownTest, SubSecondRemainderNeverGoesNegative) {
  Countdown c(absl::Milliseconds(1500));
  EXPECT_TRUE(c.Tick());
  EXPECT_EQ(c.remaining(), absl::Milliseconds(500));
  EXPECT_EQ(c.state(), TimerState::kRunning);
  EXPECT_TRUE(c.Tick());
  EXPECT_EQ(c.remaining(), absl::ZeroDuration());
  EXPECT_EQ(c.state(), TimerState::kFinished);
}

TEST(CountdownTest, ZeroIsFinishedImmediately) {
  Countdown c(absl::ZeroDuration());
  EXPECT_EQ(c.state(), TimerState::kFinished);
  EXPECT_FALSE(c.Tick());
  EXPECT_FALSE(c.TogglePause());
}

TEST(CountdownTest, PauseFreezesRemaining) {
  Countdown c(absl::Seconds(10));
  c.Tick();
  EXPECT_TRUE(c.TogglePause());
  EXPECT_EQ(c.state(), TimerState::kPaused);
  EXPECT_TRUE(c.paused());

  for (int i = 0; i < 5; ++i) {
    EXPECT_FALSE(c.Tick());
    EXPECT_EQ(c.remaining(), absl::Seconds(9));
  }

  EXPECT_TRUE(c.TogglePause());
  EXPECT_EQ(c.state(), TimerState::kRunning);
  EXPECT_TRUE(c.Tick());
  EXPECT_EQ(c.remaining(), absl::Seconds(8));
}

TEST(CountdownTest, DoublePauseIsNoop) {
  Countdown c(absl::Seconds(10));
  c.TogglePause();
  c.TogglePause();
  EXPECT_EQ(c.state(), TimerState::kRunning);
  EXPECT_EQ(c.remaining(), absl::Seconds(10));
}

TEST(CountdownTest, StopReportsElapsed) {
  Countdown c(absl::Seconds(100));
  for (int i = 0; i < 7; ++i) {
    c.Tick();
  }
  c.TogglePause();
  c.StopByUser();
  EXPECT_EQ(c.state(), TimerState::kStoppedByUser);
  EXPECT_EQ(c.remaining(), absl::Seconds(93));
  EXPECT_EQ(c.elapsed(), absl::Seconds(7));
  EXPECT_EQ(c.elapsed(), c.initial() - c.remaining());
}

TEST(CountdownTest, TerminalStatesAreSticky) {
  Countdown stopped(absl::Seconds(5));
  stopped.StopByUser();
  stopped.Finish();
  EXPECT_EQ(stopped.state(), TimerState::kStoppedByUser);

  Countdown finished(absl::Seconds(5));
  finished.Finish();
  finished.StopByUser();
  EXPECT_EQ(finished.state(), TimerState::kFinished);
  EXPECT_EQ(finished.remaining(), absl::Seconds(5));
}

TEST(CountdownTest, StateNames) {
  EXPECT_STREQ(ToString(TimerState::kRunning), "running");
  EXPECT_STREQ(ToString(TimerState::kStoppedByUser), "stopped-by-user");
}

TEST(CountdownDeathTest, RejectsNegativeStart) {
  EXPECT_EXIT(Countdown(absl::Seconds(-1)), ::testing::ExitedWithCode(5),
              "assert failed: wanted .*: countdown cannot start negative");
}

TEST(CountdownDeathTest, RejectsZeroTickUnit) {
  EXPECT_EXIT(Countdown(absl::Seconds(5), absl::ZeroDuration()),
              ::testing::ExitedWithCode(5), "tick unit must be positive");
}

}  // namespace
}  // namespace ttimer
