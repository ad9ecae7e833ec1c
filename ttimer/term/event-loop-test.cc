#include "ttimer/term/event-loop.h"

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <csignal>
#include <thread>

#include "absl/time/clock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ttimer/errors/human-error.h"
#include "ttimer/timer/recording-renderer.h"

namespace ttimer {
namespace {

using ::testing::Contains;

class Pipe {
 public:
  Pipe() {
    int fds[2];
    EXPECT_EQ(pipe(fds), 0);
    read_fd_ = fds[0];
    write_fd_ = fds[1];
  }

  ~Pipe() {
    CloseWrite();
    close(read_fd_);
  }

  int read_fd() const { return read_fd_; }

  void Write(absl::string_view bytes) {
    ASSERT_EQ(write(write_fd_, bytes.data(), bytes.size()),
              static_cast<ssize_t>(bytes.size()));
  }

  void CloseWrite() {
    if (write_fd_ != -1) {
      close(write_fd_);
      write_fd_ = -1;
    }
  }

 private:
  int read_fd_ = -1;
  int write_fd_ = -1;
};

EventLoopOptions FastTicks(int input_fd) {
  EventLoopOptions options;
  options.input_fd = input_fd;
  options.tick_period = absl::Milliseconds(5);
  options.interrupt_signals = {};
  return options;
}

EventLoopOptions NoTicks(int input_fd) {
  EventLoopOptions options;
  options.input_fd = input_fd;
  options.tick_period = absl::Hours(1);
  options.interrupt_signals = {};
  return options;
}

TEST(PopNextEventTest, InputBeforeTicks) {
  std::deque<LoopEvent> pending = {
      LoopEvent::Tick(),
      LoopEvent::Tick(),
      LoopEvent::Input(InputEvent::Key('q')),
      LoopEvent::Interrupt(),
  };

  LoopEvent ev = PopNextEvent(&pending);
  EXPECT_EQ(ev.kind, LoopEvent::kInput);
  EXPECT_EQ(ev.input, InputEvent::Key('q'));
  EXPECT_EQ(PopNextEvent(&pending).kind, LoopEvent::kInterrupt);
  EXPECT_EQ(PopNextEvent(&pending).kind, LoopEvent::kTick);
  EXPECT_EQ(PopNextEvent(&pending).kind, LoopEvent::kTick);
  EXPECT_TRUE(pending.empty());
}

TEST(PopNextEventTest, InputKeepsOrder) {
  std::deque<LoopEvent> pending = {
      LoopEvent::Input(InputEvent::Key(' ')),
      LoopEvent::Tick(),
      LoopEvent::Input(InputEvent::Key('q')),
  };
  EXPECT_EQ(PopNextEvent(&pending).input, InputEvent::Key(' '));
  EXPECT_EQ(PopNextEvent(&pending).input, InputEvent::Key('q'));
  EXPECT_EQ(PopNextEvent(&pending).kind, LoopEvent::kTick);
}

TEST(RunEventLoopTest, TicksUntilFinished) {
  RecordingRenderer r;
  TimerLoop timer(absl::Milliseconds(15), &r, absl::Milliseconds(5));
  ASSERT_TRUE(RunEventLoop(&timer, FastTicks(-1)).ok());
  EXPECT_EQ(timer.countdown().state(), TimerState::kFinished);
  EXPECT_EQ(timer.countdown().remaining(), absl::ZeroDuration());
  // First frame plus one per tick that did not finish.
  EXPECT_EQ(r.num_flushes(), 3);
}

TEST(RunEventLoopTest, QuitKeyStops) {
  Pipe p;
  p.Write("q");
  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);
  ASSERT_TRUE(RunEventLoop(&timer, NoTicks(p.read_fd())).ok());
  EXPECT_EQ(timer.countdown().state(), TimerState::kStoppedByUser);
  EXPECT_EQ(timer.countdown().remaining(), absl::Seconds(10));
  EXPECT_EQ(timer.countdown().elapsed(), absl::ZeroDuration());
}

TEST(RunEventLoopTest, CtrlCByteStops) {
  Pipe p;
  p.Write("x\x03");
  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);
  ASSERT_TRUE(RunEventLoop(&timer, NoTicks(p.read_fd())).ok());
  EXPECT_EQ(timer.countdown().state(), TimerState::kStoppedByUser);
}

TEST(RunEventLoopTest, EscKeyStops) {
  Pipe p;
  p.Write("\x1b");
  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);
  EventLoopOptions options = NoTicks(p.read_fd());
  options.escape_timeout = absl::Milliseconds(10);
  ASSERT_TRUE(RunEventLoop(&timer, options).ok());
  EXPECT_EQ(timer.countdown().state(), TimerState::kStoppedByUser);
}

TEST(RunEventLoopTest, ArrowKeySplitAcrossReadsIsIgnored) {
  Pipe p;
  p.Write("\x1b");
  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);

  std::thread writer([&p] {
    absl::SleepFor(absl::Milliseconds(50));
    p.Write("[A");
    p.CloseWrite();
  });
  absl::Status st = RunEventLoop(&timer, NoTicks(p.read_fd()));
  writer.join();

  ASSERT_TRUE(st.ok()) << st;
  EXPECT_EQ(timer.countdown().state(), TimerState::kFinished);
}

TEST(RunEventLoopTest, EscBeforeClosedInputStops) {
  Pipe p;
  p.Write("\x1b");
  p.CloseWrite();
  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);
  ASSERT_TRUE(RunEventLoop(&timer, NoTicks(p.read_fd())).ok());
  EXPECT_EQ(timer.countdown().state(), TimerState::kStoppedByUser);
}

TEST(RunEventLoopTest, ClosedInputFinishes) {
  Pipe p;
  p.Write(" ");
  p.CloseWrite();
  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);
  ASSERT_TRUE(RunEventLoop(&timer, NoTicks(p.read_fd())).ok());
  EXPECT_EQ(timer.countdown().state(), TimerState::kFinished);
  EXPECT_EQ(timer.countdown().remaining(), absl::Seconds(10));
  EXPECT_THAT(r.ops(), Contains("Print(PAUSED)"));
}

TEST(RunEventLoopTest, PausedTimerDoesNotCountDown) {
  Pipe p;
  p.Write("p");
  RecordingRenderer r;
  TimerLoop timer(absl::Milliseconds(50), &r, absl::Milliseconds(5));

  std::thread closer([&p] {
    absl::SleepFor(absl::Milliseconds(100));
    p.CloseWrite();
  });
  absl::Status st = RunEventLoop(&timer, FastTicks(p.read_fd()));
  closer.join();

  ASSERT_TRUE(st.ok()) << st;
  // The pause key wins over any tick that is ready at the same time.
  EXPECT_EQ(timer.countdown().remaining(), absl::Milliseconds(50));
  EXPECT_EQ(timer.countdown().state(), TimerState::kFinished);
}

TEST(RunEventLoopTest, SignalStops) {
  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);
  EventLoopOptions options = NoTicks(-1);
  options.interrupt_signals = {SIGUSR1};

  std::thread killer([] {
    absl::SleepFor(absl::Milliseconds(100));
    kill(getpid(), SIGUSR1);
  });
  absl::Status st = RunEventLoop(&timer, options);
  killer.join();

  ASSERT_TRUE(st.ok()) << st;
  EXPECT_EQ(timer.countdown().state(), TimerState::kStoppedByUser);
}

TEST(RunEventLoopTest, SignalBlockedBeforeStartIsHandled) {
  sigset_t usr1;
  sigemptyset(&usr1);
  sigaddset(&usr1, SIGUSR1);
  sigset_t saved;
  ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &usr1, &saved), 0);
  ASSERT_EQ(raise(SIGUSR1), 0);

  RecordingRenderer r;
  TimerLoop timer(absl::Seconds(10), &r);
  EventLoopOptions options = NoTicks(-1);
  options.interrupt_signals = {SIGUSR1};
  absl::Status st = RunEventLoop(&timer, options);

  sigset_t after;
  ASSERT_EQ(pthread_sigmask(SIG_SETMASK, &saved, &after), 0);
  EXPECT_EQ(sigismember(&after, SIGUSR1), 1);

  ASSERT_TRUE(st.ok()) << st;
  EXPECT_EQ(timer.countdown().state(), TimerState::kStoppedByUser);
}

TEST(RunEventLoopTest, RenderFailureAborts) {
  RecordingRenderer r;
  r.set_flush_status(absl::UnavailableError("tty gone"));
  TimerLoop timer(absl::Seconds(10), &r, absl::Milliseconds(5));
  absl::Status st = RunEventLoop(&timer, FastTicks(-1));
  EXPECT_TRUE(IsSystemError(st));
  EXPECT_EQ(st.message(), "Failed to write to the terminal");
  EXPECT_FALSE(timer.done());
  EXPECT_EQ(r.num_flushes(), 1);
}

TEST(RunEventLoopTest, ZeroDurationReturnsAtOnce) {
  RecordingRenderer r;
  TimerLoop timer(absl::ZeroDuration(), &r);
  ASSERT_TRUE(RunEventLoop(&timer, NoTicks(-1)).ok());
  EXPECT_EQ(timer.countdown().state(), TimerState::kFinished);
  EXPECT_EQ(r.num_flushes(), 0);
}

}  // namespace
}  // namespace ttimer
