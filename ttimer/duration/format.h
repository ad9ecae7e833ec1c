#ifndef TTIMER_DURATION_FORMAT_H_
#define TTIMER_DURATION_FORMAT_H_

#include <string>

#include "absl/time/time.h"

namespace ttimer {

// FormatRemaining renders whole seconds as "1d 2h 3m 4s". Leading zero units
// are left out; once a larger unit is shown, every smaller unit is too.
std::string FormatRemaining(absl::Duration d);

}  // namespace ttimer

#endif  // TTIMER_DURATION_FORMAT_H_
