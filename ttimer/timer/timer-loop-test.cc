#include "ttimer/timer/timer-loop.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ttimer/errors/human-error.h"
#include "ttimer/timer/recording-renderer.h"

namespace ttimer {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;

const InputEvent kPause = InputEvent::Key(' ');
const InputEvent kQuit = InputEvent::Key('q');

TEST(ActionForKeyTest, Bindings) {
  EXPECT_EQ(ActionForKey(InputEvent::Key('q')), KeyAction::kQuit);
  EXPECT_EQ(ActionForKey(InputEvent::Key('Q')), KeyAction::kQuit);
  EXPECT_EQ(ActionForKey(InputEvent::Key(kKeyEsc)), KeyAction::kQuit);
  EXPECT_EQ(ActionForKey(InputEvent::Key('c', kCtrl)), KeyAction::kInterrupt);
  EXPECT_EQ(ActionForKey(InputEvent::Key(' ')), KeyAction::kTogglePause);
  EXPECT_EQ(ActionForKey(InputEvent::Key('p')), KeyAction::kTogglePause);
  EXPECT_EQ(ActionForKey(InputEvent::Key('P')), KeyAction::kTogglePause);

  EXPECT_EQ(ActionForKey(InputEvent::Key('c')), KeyAction::kIgnore);
  EXPECT_EQ(ActionForKey(InputEvent::Key('q', kAlt)), KeyAction::kIgnore);
  EXPECT_EQ(ActionForKey(InputEvent::Key('d', kCtrl)), KeyAction::kIgnore);
  EXPECT_EQ(ActionForKey(InputEvent::Other()), KeyAction::kIgnore);
  EXPECT_EQ(ActionForKey(InputEvent::Closed()), KeyAction::kIgnore);
}

TEST(TimerLoopTest, StartDrawsFirstFrame) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(90), &r);
  ASSERT_TRUE(loop.Start().ok());
  EXPECT_THAT(r.ops(), ElementsAre("BeginSync", "ClearScreen", "MoveTo(0,0)",
                                   "Print(Remaining time: 1m 30s)", "EndSync", "Flush"));
}

TEST(TimerLoopTest, TicksRedrawUntilFinished) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(2), &r);
  ASSERT_TRUE(loop.Start().ok());
  r.ClearOps();

  ASSERT_TRUE(loop.OnTick().ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kRunning);
  EXPECT_THAT(r.ops(), ElementsAre("BeginSync", "ClearScreen", "MoveTo(0,0)",
                                   "Print(Remaining time: 1s)", "EndSync", "Flush"));
  r.ClearOps();

  ASSERT_TRUE(loop.OnTick().ok());
  EXPECT_TRUE(loop.done());
  EXPECT_EQ(loop.countdown().state(), TimerState::kFinished);
  EXPECT_EQ(loop.countdown().remaining(), absl::ZeroDuration());
  EXPECT_THAT(r.ops(), IsEmpty());
  EXPECT_EQ(loop.ExitMessage(), "Timer finished!\n");
}

TEST(TimerLoopTest, ZeroDurationFinishesWithoutDrawing) {
  RecordingRenderer r;
  TimerLoop loop(absl::ZeroDuration(), &r);
  ASSERT_TRUE(loop.Start().ok());
  EXPECT_TRUE(loop.done());
  EXPECT_THAT(r.ops(), IsEmpty());
}

TEST(TimerLoopTest, PauseFreezesAndResumes) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(10), &r);
  ASSERT_TRUE(loop.Start().ok());
  ASSERT_TRUE(loop.OnTick().ok());
  r.ClearOps();

  ASSERT_TRUE(loop.OnInput(kPause).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kPaused);
  EXPECT_TRUE(loop.countdown().paused_message_shown());
  EXPECT_THAT(r.ops(), ElementsAre("BeginSync", "MoveTo(0,1)", "ClearLine", "Print(PAUSED)",
                                   "MoveTo(0,2)", "ClearLine",
                                   "Print(Press space or p to resume, q to quit)", "EndSync",
                                   "Flush"));
  r.ClearOps();

  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(loop.OnTick().ok());
    EXPECT_EQ(loop.countdown().remaining(), absl::Seconds(9));
  }
  // The banner is already up, so paused ticks draw nothing.
  EXPECT_THAT(r.ops(), IsEmpty());

  ASSERT_TRUE(loop.OnInput(kPause).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kRunning);
  EXPECT_FALSE(loop.countdown().paused_message_shown());
  EXPECT_THAT(r.ops(), ElementsAre("BeginSync", "MoveTo(0,1)", "ClearLine", "MoveTo(0,2)",
                                   "ClearLine", "EndSync", "Flush"));
  r.ClearOps();

  ASSERT_TRUE(loop.OnTick().ok());
  EXPECT_EQ(loop.countdown().remaining(), absl::Seconds(8));
  EXPECT_THAT(r.ops(), Contains("Print(Remaining time: 8s)"));
}

TEST(TimerLoopTest, PausedTickRedrawsBannerIfMissing) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(10), &r);
  ASSERT_TRUE(loop.Start().ok());

  r.set_flush_status(absl::UnavailableError("tty gone"));
  EXPECT_FALSE(loop.OnInput(kPause).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kPaused);
  EXPECT_FALSE(loop.countdown().paused_message_shown());

  r.set_flush_status(absl::OkStatus());
  r.ClearOps();
  ASSERT_TRUE(loop.OnTick().ok());
  EXPECT_TRUE(loop.countdown().paused_message_shown());
  EXPECT_THAT(r.ops(), Contains("Print(PAUSED)"));
  EXPECT_EQ(loop.countdown().remaining(), absl::Seconds(10));
}

TEST(TimerLoopTest, DoublePauseBeforeTickKeepsRemaining) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(5), &r);
  ASSERT_TRUE(loop.Start().ok());
  ASSERT_TRUE(loop.OnInput(kPause).ok());
  ASSERT_TRUE(loop.OnInput(kPause).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kRunning);
  EXPECT_EQ(loop.countdown().remaining(), absl::Seconds(5));
  EXPECT_FALSE(loop.countdown().paused_message_shown());
}

TEST(TimerLoopTest, QuitReportsRemainingAndElapsed) {
  RecordingRenderer r;
  TimerLoop loop(absl::Minutes(2), &r);
  ASSERT_TRUE(loop.Start().ok());
  for (int i = 0; i < 25; ++i) {
    ASSERT_TRUE(loop.OnTick().ok());
  }
  ASSERT_TRUE(loop.OnInput(kQuit).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kStoppedByUser);
  EXPECT_EQ(loop.countdown().elapsed(), absl::Seconds(25));
  EXPECT_EQ(loop.countdown().elapsed(),
            loop.countdown().initial() - loop.countdown().remaining());
  EXPECT_EQ(loop.ExitMessage(), "Timer stopped by user at 1m 35s (elapsed 25s).\n");
}

TEST(TimerLoopTest, QuitWhilePaused) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(30), &r);
  ASSERT_TRUE(loop.Start().ok());
  ASSERT_TRUE(loop.OnTick().ok());
  ASSERT_TRUE(loop.OnInput(kPause).ok());
  ASSERT_TRUE(loop.OnTick().ok());
  ASSERT_TRUE(loop.OnInput(InputEvent::Key('c', kCtrl)).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kStoppedByUser);
  EXPECT_EQ(loop.countdown().elapsed(), absl::Seconds(1));
}

TEST(TimerLoopTest, InterruptSignalStops) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(30), &r);
  ASSERT_TRUE(loop.Start().ok());
  ASSERT_TRUE(loop.OnTick().ok());
  ASSERT_TRUE(loop.OnTick().ok());
  ASSERT_TRUE(loop.OnInterrupt().ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kStoppedByUser);
  EXPECT_EQ(loop.ExitMessage(), "Timer stopped by user at 28s (elapsed 2s).\n");
}

TEST(TimerLoopTest, ClosedInputFinishes) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(30), &r);
  ASSERT_TRUE(loop.Start().ok());
  ASSERT_TRUE(loop.OnInput(InputEvent::Closed()).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kFinished);
  EXPECT_EQ(loop.ExitMessage(), "Timer finished!\n");
}

TEST(TimerLoopTest, OtherInputIsIgnored) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(30), &r);
  ASSERT_TRUE(loop.Start().ok());
  r.ClearOps();
  ASSERT_TRUE(loop.OnInput(InputEvent::Other()).ok());
  ASSERT_TRUE(loop.OnInput(InputEvent::Key('x')).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kRunning);
  EXPECT_THAT(r.ops(), IsEmpty());
}

TEST(TimerLoopTest, EventsAfterStopAreIgnored) {
  RecordingRenderer r;
  TimerLoop loop(absl::Seconds(30), &r);
  ASSERT_TRUE(loop.Start().ok());
  ASSERT_TRUE(loop.OnInterrupt().ok());
  r.ClearOps();
  ASSERT_TRUE(loop.OnTick().ok());
  ASSERT_TRUE(loop.OnInput(kPause).ok());
  ASSERT_TRUE(loop.OnInput(InputEvent::Closed()).ok());
  EXPECT_EQ(loop.countdown().state(), TimerState::kStoppedByUser);
  EXPECT_EQ(loop.countdown().remaining(), absl::Seconds(30));
  EXPECT_THAT(r.ops(), IsEmpty());
}

TEST(TimerLoopTest, WriteFailureIsSystemError) {
  RecordingRenderer r;
  r.set_flush_status(absl::UnavailableError("broken pipe"));
  TimerLoop loop(absl::Seconds(30), &r);
  absl::Status st = loop.Start();
  EXPECT_TRUE(IsSystemError(st));
  EXPECT_EQ(st.message(), "Failed to write to the terminal");
  EXPECT_EQ(ErrorHint(st), "Try notifying the developer");
  EXPECT_THAT(r.ops(), Not(Contains("Print(PAUSED)")));
}

TEST(TimerLoopTest, SubSecondInitialDuration) {
  RecordingRenderer r;
  TimerLoop loop(absl::Milliseconds(1500), &r);
  ASSERT_TRUE(loop.Start().ok());
  EXPECT_THAT(r.ops(), Contains("Print(Remaining time: 1s)"));
  ASSERT_TRUE(loop.OnTick().ok());
  EXPECT_FALSE(loop.done());
  ASSERT_TRUE(loop.OnTick().ok());
  EXPECT_TRUE(loop.done());
  EXPECT_EQ(loop.countdown().remaining(), absl::ZeroDuration());
}

}  // namespace
}  // namespace ttimer
