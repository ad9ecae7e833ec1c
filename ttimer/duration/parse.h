#ifndef TTIMER_DURATION_PARSE_H_
#define TTIMER_DURATION_PARSE_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace ttimer {

// ParseDuration parses "[[[d:]h:]m:]s[.ms]" into a non-negative duration.
//
// Fields are read from the right: seconds (with an optional count of
// milliseconds after a dot), then minutes, hours and days. Errors are user
// errors (see ttimer/errors/human-error.h) whose title says which field failed
// and, for overflows, which unit overflowed.
absl::StatusOr<absl::Duration> ParseDuration(absl::string_view input);

}  // namespace ttimer

#endif  // TTIMER_DURATION_PARSE_H_
