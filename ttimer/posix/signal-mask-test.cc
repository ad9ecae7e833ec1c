#include "ttimer/posix/signal-mask.h"

#include <pthread.h>
#include <signal.h>

#include "gtest/gtest.h"

namespace ttimer {
namespace {

bool IsBlocked(int signo) {
  sigset_t current;
  EXPECT_EQ(pthread_sigmask(SIG_SETMASK, nullptr, &current), 0);
  return sigismember(&current, signo) == 1;
}

TEST(SignalMaskTest, BlockThenRestore) {
  sigset_t saved;
  ASSERT_TRUE(BlockSignals({SIGUSR2}, &saved).ok());
  EXPECT_TRUE(IsBlocked(SIGUSR2));
  EXPECT_FALSE(sigismember(&saved, SIGUSR2));

  ASSERT_TRUE(SetSignalMask(saved).ok());
  EXPECT_FALSE(IsBlocked(SIGUSR2));
}

TEST(SignalMaskTest, BlockedSignalStaysPending) {
  sigset_t saved;
  ASSERT_TRUE(BlockSignals({SIGUSR2}, &saved).ok());
  ASSERT_EQ(raise(SIGUSR2), 0);

  sigset_t pending;
  ASSERT_EQ(sigpending(&pending), 0);
  EXPECT_EQ(sigismember(&pending, SIGUSR2), 1);

  // Consume it so restoring the mask does not deliver it.
  int got = 0;
  sigset_t wait_set;
  sigemptyset(&wait_set);
  sigaddset(&wait_set, SIGUSR2);
  ASSERT_EQ(sigwait(&wait_set, &got), 0);
  EXPECT_EQ(got, SIGUSR2);
  ASSERT_TRUE(SetSignalMask(saved).ok());
}

TEST(SignalMaskTest, UnblockReportsPreviousMask) {
  sigset_t saved;
  ASSERT_TRUE(BlockSignals({SIGUSR2}, &saved).ok());
  sigset_t blocked;
  ASSERT_TRUE(UnblockSignals({SIGUSR2}, &blocked).ok());
  EXPECT_EQ(sigismember(&blocked, SIGUSR2), 1);
  EXPECT_FALSE(IsBlocked(SIGUSR2));
  ASSERT_TRUE(SetSignalMask(saved).ok());
}

TEST(SignalMaskTest, RejectsBadSignal) {
  EXPECT_FALSE(BlockSignals({-1}, nullptr).ok());
}

}  // namespace
}  // namespace ttimer
