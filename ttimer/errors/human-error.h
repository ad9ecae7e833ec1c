#ifndef TTIMER_ERRORS_HUMAN_ERROR_H_
#define TTIMER_ERRORS_HUMAN_ERROR_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace ttimer {

// Human errors are absl::Status values with a short title as the message and
// extra payloads that explain how to fix the problem.
//
// User errors (bad input) have code kInvalidArgument. System errors (terminal
// or runtime failures) have code kInternal.

constexpr char kHintPayloadUrl[] = "type.ttimer/hint";
constexpr char kCausePayloadUrl[] = "type.ttimer/cause";
constexpr char kCauseHintPayloadUrl[] = "type.ttimer/cause-hint";
constexpr char kInternalPayloadUrl[] = "type.ttimer/internal";

absl::Status UserError(absl::string_view title, absl::string_view hint);

// Wraps another human error (usually a UserError) as the cause.
absl::Status UserErrorWithCause(absl::string_view title, absl::string_view hint,
                                const absl::Status& cause);

// Wraps a lower-level failure description as the internal detail.
absl::Status UserErrorWithInternal(absl::string_view title, absl::string_view hint,
                                   absl::string_view internal);

absl::Status SystemErrorWithInternal(absl::string_view title, absl::string_view hint,
                                     absl::string_view internal);

bool IsUserError(const absl::Status& status);
bool IsSystemError(const absl::Status& status);

std::string ErrorHint(const absl::Status& status);
absl::optional<std::string> ErrorCause(const absl::Status& status);
absl::optional<std::string> ErrorInternal(const absl::Status& status);

// Multi-line description meant for stderr.
std::string FormatHumanError(const absl::Status& status);

}  // namespace ttimer

#endif  // TTIMER_ERRORS_HUMAN_ERROR_H_
