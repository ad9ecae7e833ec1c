#include "ttimer/posix/signal-mask.h"

#include <pthread.h>

#include "absl/strings/str_cat.h"
#include "ttimer/posix/strerror.h"

namespace ttimer {
namespace {

absl::Status ChangeMask(int how, const std::vector<int>& signos, sigset_t* saved) {
  sigset_t set;
  sigemptyset(&set);
  for (int signo : signos) {
    if (sigaddset(&set, signo) != 0) {
      return absl::InvalidArgumentError(absl::StrCat("bad signal number ", signo));
    }
  }
  int rc = pthread_sigmask(how, &set, saved);
  if (rc != 0) {
    return absl::InternalError(absl::StrCat("failed to change signal mask: ", StrError(rc)));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status BlockSignals(const std::vector<int>& signos, sigset_t* saved) {
  return ChangeMask(SIG_BLOCK, signos, saved);
}

absl::Status UnblockSignals(const std::vector<int>& signos, sigset_t* saved) {
  return ChangeMask(SIG_UNBLOCK, signos, saved);
}

absl::Status SetSignalMask(const sigset_t& mask) {
  int rc = pthread_sigmask(SIG_SETMASK, &mask, nullptr);
  if (rc != 0) {
    return absl::InternalError(absl::StrCat("failed to restore signal mask: ", StrError(rc)));
  }
  return absl::OkStatus();
}

}  // namespace ttimer
