#ifndef TTIMER_POSIX_SIGNAL_MASK_H_
#define TTIMER_POSIX_SIGNAL_MASK_H_

#include <signal.h>

#include <vector>

#include "absl/status/status.h"

namespace ttimer {

// These change the signal mask of the calling thread. When saved is not
// null, it receives the mask in effect before the change.
//
// A blocked signal stays pending until it is unblocked, so blocking signals
// before their handler exists defers them instead of losing them.
absl::Status BlockSignals(const std::vector<int>& signos, sigset_t* saved);
absl::Status UnblockSignals(const std::vector<int>& signos, sigset_t* saved);
absl::Status SetSignalMask(const sigset_t& mask);

}  // namespace ttimer

#endif  // TTIMER_POSIX_SIGNAL_MASK_H_
