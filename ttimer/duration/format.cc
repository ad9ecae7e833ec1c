#include "ttimer/duration/format.h"

#include <cstdint>

#include "absl/strings/str_cat.h"

namespace ttimer {

std::string FormatRemaining(absl::Duration d) {
  if (d < absl::ZeroDuration()) {
    d = absl::ZeroDuration();
  }
  const int64_t total_seconds = absl::ToInt64Seconds(d);
  const int64_t days = total_seconds / 86400;
  const int64_t hours = (total_seconds % 86400) / 3600;
  const int64_t minutes = (total_seconds % 3600) / 60;
  const int64_t seconds = total_seconds % 60;

  std::string out;
  if (days > 0) {
    absl::StrAppend(&out, days, "d ");
  }
  if (hours > 0 || days > 0) {
    absl::StrAppend(&out, hours, "h ");
  }
  if (minutes > 0 || hours > 0 || days > 0) {
    absl::StrAppend(&out, minutes, "m ");
  }
  absl::StrAppend(&out, seconds, "s");
  return out;
}

}  // namespace ttimer
